// circ_dsl/syntax/parser.hpp - Recursive-descent parser
#pragma once

#include <string_view>
#include <vector>

#include "circ_dsl/ast/ast.hpp"
#include "circ_dsl/ast/ast_context.hpp"
#include "circ_dsl/basic/diagnostic.hpp"
#include "circ_dsl/basic/source_manager.hpp"
#include "circ_dsl/syntax/token.hpp"

namespace circ_dsl::syntax
{

/**
 * Builds a Program from a token stream.
 *
 * Syntax errors are reported to the DiagnosticBag and the parser resynchronises
 * at the next statement or declaration, so a Program is always returned.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, FileId file_id, const SourceFile & source, DiagnosticBag & diags,
    std::vector<Token> tokens)
  : ast_(ast), file_id_(file_id), source_(source), diags_(diags), tokens_(std::move(tokens))
  {
  }

  /// @param program_name Initial program name (usually the file stem)
  [[nodiscard]] Program * parse_program(std::string_view program_name);

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] SourceRange prev_range() const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what);

  void error_at(const Token & t, std::string_view msg);
  void synchronize_to_stmt();
  void synchronize_to_decl();

  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] static bool is_reserved_ident(std::string_view ident);
  bool expect_identifier_not_reserved(std::string_view what);

  // Top-level
  [[nodiscard]] ImportDecl * parse_import_decl();
  [[nodiscard]] Package * parse_package();
  [[nodiscard]] PackageAccess * parse_package_access();
  [[nodiscard]] CircuitDecl * parse_circuit_decl();
  [[nodiscard]] CircuitMember * parse_circuit_member();
  [[nodiscard]] FunctionDecl * parse_function_decl();
  [[nodiscard]] FunctionInput * parse_function_input();
  [[nodiscard]] std::string_view parse_package_name(SourceRange & range);

  // Statements
  [[nodiscard]] BlockStmt * parse_block();
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] ReturnStmt * parse_return_stmt();
  [[nodiscard]] DefinitionStmt * parse_definition_stmt();
  [[nodiscard]] ConditionalStmt * parse_conditional_stmt();
  [[nodiscard]] IterationStmt * parse_iteration_stmt();
  [[nodiscard]] Stmt * parse_assign_or_expr_stmt();

  // Types
  [[nodiscard]] TypeNode * parse_type();
  [[nodiscard]] TypeNode * parse_array_type();

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_equality();
  [[nodiscard]] Expr * parse_comparison();
  [[nodiscard]] Expr * parse_add();
  [[nodiscard]] Expr * parse_mul();
  [[nodiscard]] Expr * parse_pow();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_primary();

  [[nodiscard]] Expr * make_missing_expr_at(const Token & t);

  AstContext & ast_;
  FileId file_id_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace circ_dsl::syntax
