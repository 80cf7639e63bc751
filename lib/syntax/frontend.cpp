// circ_dsl/syntax/frontend.cpp - High-level parse pipeline
#include "circ_dsl/syntax/frontend.hpp"

#include <utility>

#include "circ_dsl/syntax/lexer.hpp"
#include "circ_dsl/syntax/parser.hpp"

namespace circ_dsl
{

std::string_view strip_source_extension(std::string_view file_name) noexcept
{
  if (
    file_name.size() >= k_source_extension.size() &&
    file_name.substr(file_name.size() - k_source_extension.size()) == k_source_extension) {
    file_name.remove_suffix(k_source_extension.size());
  }
  return file_name;
}

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags)
{
  ParseOutput out;
  out.file_id = sources.register_file(path, std::move(source_text));
  const SourceFile * file = sources.get_file(out.file_id);

  syntax::Lexer lexer(out.file_id, file->content());
  syntax::Parser parser(ast, out.file_id, *file, diags, lexer.lex_all());

  const std::string file_name = path.filename().string();
  out.program = parser.parse_program(strip_source_extension(file_name));
  return out;
}

}  // namespace circ_dsl
