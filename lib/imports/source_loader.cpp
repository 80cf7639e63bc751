// circ_dsl/imports/source_loader.cpp - Loading imported source files
#include "circ_dsl/imports/source_loader.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include "circ_dsl/basic/diagnostic.hpp"
#include "circ_dsl/syntax/frontend.hpp"

namespace circ_dsl
{
namespace
{

std::string first_error_text(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  for (const Diagnostic & d : diags) {
    if (d.severity != Severity::Error) continue;

    const FullSourceRange full = sources.get_full_range(d.primary_range());
    if (!full.is_valid()) {
      return d.message;
    }
    return std::to_string(full.start_line) + ":" + std::to_string(full.start_column) + ": " +
           d.message;
  }
  return "syntax error";
}

}  // namespace

bool is_valid_utf8(std::string_view bytes) noexcept
{
  size_t i = 0;
  while (i < bytes.size()) {
    const auto c = static_cast<unsigned char>(bytes[i]);
    size_t len = 0;
    uint32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    }
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > bytes.size()) {
      return false;
    }
    for (size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<unsigned char>(bytes[i + k]);
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong encodings, surrogates and out-of-range code points
    if (
      (len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
      (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
      return false;
    }
    i += len;
  }
  return true;
}

SourceLoadResult parse_import_file(
  const std::filesystem::directory_entry & entry, SourceRange span, SourceRegistry & sources)
{
  const std::filesystem::path & path = entry.path();

  // Symlinks are followed: a link to a directory is ExpectedFile.
  std::error_code ec;
  const std::filesystem::file_status status = entry.status(ec);
  if (ec) {
    return SourceLoadResult::fail(ImportError::directory_error(ec.message(), path, span));
  }

  const std::string file_name = path.filename().string();
  if (!is_valid_utf8(file_name)) {
    return SourceLoadResult::fail(ImportError::convert_os_string(path, span));
  }

  if (std::filesystem::is_directory(status)) {
    return SourceLoadResult::fail(ImportError::expected_file(file_name, path, span));
  }

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    return SourceLoadResult::fail(ImportError::parse_error("cannot open file", path, span));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return SourceLoadResult::fail(ImportError::parse_error("cannot read file", path, span));
  }

  LoadedProgram loaded;
  loaded.ast = std::make_unique<AstContext>();
  loaded.path = path;

  DiagnosticBag diags;
  const ParseOutput parsed = parse_source(sources, path, buffer.str(), *loaded.ast, diags);
  if (diags.has_errors()) {
    return SourceLoadResult::fail(
      ImportError::parse_error(first_error_text(diags, sources), path, span));
  }

  loaded.program = parsed.program;
  return SourceLoadResult::ok(std::move(loaded));
}

}  // namespace circ_dsl
