// circ_dsl/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "circ_dsl/ast/ast.hpp"
#include "circ_dsl/ast/ast_context.hpp"
#include "circ_dsl/basic/diagnostic.hpp"
#include "circ_dsl/basic/source_manager.hpp"

namespace circ_dsl
{

/// Extension of source files, including the dot.
inline constexpr std::string_view k_source_extension = ".leo";

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  Program * program = nullptr;
};

/// File name with a trailing `.leo` removed, e.g. "token.leo" -> "token".
[[nodiscard]] std::string_view strip_source_extension(std::string_view file_name) noexcept;

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
//
// The program is named after the file name without its extension.
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags);

}  // namespace circ_dsl
