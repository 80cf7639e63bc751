// circ_dsl/basic/source_manager.hpp - Source files, locations and ranges
//
// Every range carries the FileId of the file it points into, so diagnostics
// coming from imported packages can be rendered against the right source.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace circ_dsl
{

namespace fs = std::filesystem;

// ============================================================================
// FileId
// ============================================================================

/**
 * Index of a file registered in a SourceRegistry.
 */
struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
};

// ============================================================================
// SourceLocation
// ============================================================================

/**
 * Byte offset into a source file.
 */
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }

private:
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange
// ============================================================================

/**
 * Half-open byte range [begin, end) inside one file.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(FileId file, uint32_t begin, uint32_t end) noexcept
  : file_id_(file), begin_(begin), end_(end)
  {
  }

  constexpr SourceRange(FileId file, SourceLocation begin, SourceLocation end) noexcept
  : file_id_(file), begin_(begin), end_(end)
  {
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_id_; }
  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_id_.is_valid() && begin_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (!is_valid()) return 0;
    return end_.offset() - begin_.offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return file_id_ == other.file_id_ && begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  FileId file_id_;
  SourceLocation begin_;
  SourceLocation end_;
};

/// Smallest range covering both inputs. Invalid inputs are ignored.
[[nodiscard]] constexpr SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (!a.is_valid()) return b;
  if (!b.is_valid()) return a;
  return {a.file_id(), a.get_begin(), b.get_end()};
}

// ============================================================================
// Line / column
// ============================================================================

struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * Content of one source file plus a table of line start offsets.
 */
class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  void set_content(std::string new_content);

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Line text without its terminator (0-indexed line number).
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  fs::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry
// ============================================================================

/**
 * Owns every source file read during one compilation.
 *
 * Files are keyed by their normalized path; registering the same path twice
 * returns the existing id and replaces the content.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  FileId register_file(fs::path path, std::string content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] fs::path get_path(FileId id) const;
  [[nodiscard]] FileId find_by_path(const fs::path & path) const;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  [[nodiscard]] static std::string normalize_key(const fs::path & path);

  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, FileId> path_to_id_;
};

}  // namespace circ_dsl
