// circ_dsl/imports/import_error.hpp - Typed failures of import resolution
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "circ_dsl/basic/source_manager.hpp"

namespace circ_dsl
{

enum class ImportErrorKind : uint8_t {
  DirectoryError,   ///< directory listing or file type query failed
  ConvertOsString,  ///< file name is not valid UTF-8
  ExpectedFile,     ///< matched entry is a directory
  UnknownSymbol,    ///< package has no circuit or function of that name
  UnknownPackage,   ///< no `src/<name>.leo` under the search root
  ParseError,       ///< imported file could not be read or parsed
  CyclicImport,     ///< file is already being resolved on the current path
};

[[nodiscard]] constexpr std::string_view to_string(ImportErrorKind k) noexcept
{
  switch (k) {
    case ImportErrorKind::DirectoryError:
      return "DirectoryError";
    case ImportErrorKind::ConvertOsString:
      return "ConvertOsString";
    case ImportErrorKind::ExpectedFile:
      return "ExpectedFile";
    case ImportErrorKind::UnknownSymbol:
      return "UnknownSymbol";
    case ImportErrorKind::UnknownPackage:
      return "UnknownPackage";
    case ImportErrorKind::ParseError:
      return "ParseError";
    case ImportErrorKind::CyclicImport:
      return "CyclicImport";
  }
  return "DirectoryError";
}

/// Stable diagnostic code for an import failure (see diagnostic_codes.hpp).
[[nodiscard]] std::string_view diagnostic_code(ImportErrorKind k) noexcept;

/**
 * A failed import. `range` points at the import in the importing file;
 * `path` is the file or directory involved, when there is one.
 */
struct ImportError
{
  ImportErrorKind kind = ImportErrorKind::DirectoryError;
  std::string message;
  SourceRange range;
  std::filesystem::path path;

  [[nodiscard]] static ImportError directory_error(
    std::string_view detail, const std::filesystem::path & path, SourceRange range);
  [[nodiscard]] static ImportError convert_os_string(
    const std::filesystem::path & path, SourceRange range);
  [[nodiscard]] static ImportError expected_file(
    std::string_view entry_name, const std::filesystem::path & path, SourceRange range);
  [[nodiscard]] static ImportError unknown_symbol(
    std::string_view symbol, std::string_view program, const std::filesystem::path & path,
    SourceRange range);
  [[nodiscard]] static ImportError unknown_package(std::string_view package, SourceRange range);
  [[nodiscard]] static ImportError parse_error(
    std::string_view detail, const std::filesystem::path & path, SourceRange range);
  [[nodiscard]] static ImportError cyclic_import(
    const std::filesystem::path & path, SourceRange range);
};

/**
 * Result of an import operation.
 */
struct ImportStatus
{
  bool success = false;
  std::optional<ImportError> error;

  [[nodiscard]] static ImportStatus ok() { return ImportStatus{true, std::nullopt}; }
  [[nodiscard]] static ImportStatus fail(ImportError e)
  {
    return ImportStatus{false, std::move(e)};
  }
};

}  // namespace circ_dsl
