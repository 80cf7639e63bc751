// circ_dsl/imports/source_loader.hpp - Loading imported source files
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include "circ_dsl/ast/ast.hpp"
#include "circ_dsl/ast/ast_context.hpp"
#include "circ_dsl/basic/source_manager.hpp"
#include "circ_dsl/imports/import_error.hpp"

namespace circ_dsl
{

/// Directory under a package root that holds its source files.
inline constexpr std::string_view k_source_directory_name = "src";

/**
 * A parsed program together with the arena that owns its nodes.
 */
struct LoadedProgram
{
  std::unique_ptr<AstContext> ast;
  Program * program = nullptr;
  std::filesystem::path path;
};

struct SourceLoadResult
{
  bool success = false;
  std::optional<LoadedProgram> loaded;
  std::optional<ImportError> error;

  [[nodiscard]] static SourceLoadResult ok(LoadedProgram program)
  {
    SourceLoadResult r;
    r.success = true;
    r.loaded = std::move(program);
    return r;
  }

  [[nodiscard]] static SourceLoadResult fail(ImportError e)
  {
    SourceLoadResult r;
    r.error = std::move(e);
    return r;
  }
};

/// True when `bytes` is well-formed UTF-8.
[[nodiscard]] bool is_valid_utf8(std::string_view bytes) noexcept;

/**
 * Parse the file behind a directory entry into a Program.
 *
 * Checks, in order: the entry's file type can be determined (DirectoryError),
 * its name is valid UTF-8 (ConvertOsString), it is not a directory
 * (ExpectedFile). Read and syntax errors fail with ParseError.
 *
 * The program is named after the file name without `.leo`.
 *
 * @param entry Directory entry of the file to load
 * @param span Location of the import that requested the file
 * @param sources Registry the file content is registered in
 */
[[nodiscard]] SourceLoadResult parse_import_file(
  const std::filesystem::directory_entry & entry, SourceRange span, SourceRegistry & sources);

}  // namespace circ_dsl
