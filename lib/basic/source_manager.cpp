// circ_dsl/basic/source_manager.cpp - Source file and registry implementation
#include "circ_dsl/basic/source_manager.hpp"

#include <algorithm>

namespace circ_dsl
{

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  build_line_table();
}

void SourceFile::set_content(std::string new_content)
{
  content_ = std::move(new_content);
  build_line_table();
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  --it;  // line_offsets_[0] == 0, so upper_bound never returns begin()

  const auto line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  return {line, offset - *it + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(content_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1] - 1;
  }
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }
  return std::string_view(content_).substr(start, end - start);
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }
  const uint32_t start = range.get_begin().offset();
  const uint32_t end = std::min(range.get_end().offset(), static_cast<uint32_t>(content_.size()));
  if (start >= end) {
    return {};
  }
  return std::string_view(content_).substr(start, end - start);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (!range.is_valid()) {
    return result;
  }

  result.start_byte = range.get_begin().offset();
  result.end_byte = range.get_end().offset();

  const LineColumn start = get_line_column(result.start_byte);
  const LineColumn end = get_line_column(result.end_byte);
  result.start_line = start.line;
  result.start_column = start.column;
  result.end_line = end.line;
  result.end_column = end.column;
  return result;
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);
  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

// ============================================================================
// SourceRegistry
// ============================================================================

std::string SourceRegistry::normalize_key(const fs::path & path)
{
  std::error_code ec;
  const fs::path canonical = fs::weakly_canonical(path, ec);
  if (ec) {
    return path.lexically_normal().string();
  }
  return canonical.string();
}

FileId SourceRegistry::register_file(fs::path path, std::string content)
{
  const std::string key = normalize_key(path);
  if (const auto it = path_to_id_.find(key); it != path_to_id_.end()) {
    files_[it->second.value]->set_content(std::move(content));
    return it->second;
  }

  if (files_.size() >= static_cast<size_t>(FileId::k_invalid)) {
    return FileId::invalid();
  }

  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  path_to_id_.emplace(key, id);
  return id;
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return files_[id.value].get();
}

fs::path SourceRegistry::get_path(FileId id) const
{
  const SourceFile * file = get_file(id);
  return file != nullptr ? file->path() : fs::path{};
}

FileId SourceRegistry::find_by_path(const fs::path & path) const
{
  const auto it = path_to_id_.find(normalize_key(path));
  return it != path_to_id_.end() ? it->second : FileId::invalid();
}

std::string_view SourceRegistry::get_slice(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->get_slice(range) : std::string_view{};
}

FullSourceRange SourceRegistry::get_full_range(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->get_full_range(range) : FullSourceRange{};
}

}  // namespace circ_dsl
