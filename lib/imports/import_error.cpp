// circ_dsl/imports/import_error.cpp - Import error factories
#include "circ_dsl/imports/import_error.hpp"

#include <string>

#include "circ_dsl/basic/diagnostic_codes.hpp"

namespace circ_dsl
{

std::string_view diagnostic_code(ImportErrorKind k) noexcept
{
  switch (k) {
    case ImportErrorKind::DirectoryError:
      return diag_code::k_directory_error;
    case ImportErrorKind::ConvertOsString:
      return diag_code::k_convert_os_string;
    case ImportErrorKind::ExpectedFile:
      return diag_code::k_expected_file;
    case ImportErrorKind::UnknownSymbol:
      return diag_code::k_unknown_symbol;
    case ImportErrorKind::UnknownPackage:
      return diag_code::k_unknown_package;
    case ImportErrorKind::ParseError:
      return diag_code::k_import_parse_error;
    case ImportErrorKind::CyclicImport:
      return diag_code::k_cyclic_import;
  }
  return diag_code::k_directory_error;
}

ImportError ImportError::directory_error(
  std::string_view detail, const std::filesystem::path & path, SourceRange range)
{
  return ImportError{
    ImportErrorKind::DirectoryError,
    "cannot read directory `" + path.string() + "`: " + std::string(detail), range, path};
}

ImportError ImportError::convert_os_string(const std::filesystem::path & path, SourceRange range)
{
  return ImportError{
    ImportErrorKind::ConvertOsString, "file name is not valid UTF-8: `" + path.string() + "`",
    range, path};
}

ImportError ImportError::expected_file(
  std::string_view entry_name, const std::filesystem::path & path, SourceRange range)
{
  return ImportError{
    ImportErrorKind::ExpectedFile,
    "expected file, found directory `" + std::string(entry_name) + "`", range, path};
}

ImportError ImportError::unknown_symbol(
  std::string_view symbol, std::string_view program, const std::filesystem::path & path,
  SourceRange range)
{
  return ImportError{
    ImportErrorKind::UnknownSymbol,
    "cannot find imported symbol `" + std::string(symbol) + "` in package `" +
      std::string(program) + "`",
    range, path};
}

ImportError ImportError::unknown_package(std::string_view package, SourceRange range)
{
  return ImportError{
    ImportErrorKind::UnknownPackage, "cannot find imported package `" + std::string(package) + "`",
    range, {}};
}

ImportError ImportError::parse_error(
  std::string_view detail, const std::filesystem::path & path, SourceRange range)
{
  return ImportError{
    ImportErrorKind::ParseError,
    "failed to parse imported file `" + path.string() + "`: " + std::string(detail), range, path};
}

ImportError ImportError::cyclic_import(const std::filesystem::path & path, SourceRange range)
{
  return ImportError{
    ImportErrorKind::CyclicImport, "cyclic import of `" + path.string() + "`", range, path};
}

}  // namespace circ_dsl
