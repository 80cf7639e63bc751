#include "circ_dsl/syntax/parser.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>

#include "circ_dsl/basic/diagnostic_codes.hpp"

namespace circ_dsl::syntax
{
namespace
{

[[nodiscard]] std::string describe(const Token & t)
{
  if (t.kind == TokenKind::Eof) {
    return "end of file";
  }
  return "`" + std::string(t.text) + "`";
}

[[nodiscard]] bool is_assign_op(TokenKind k) noexcept
{
  return k == TokenKind::Eq || k == TokenKind::PlusEq || k == TokenKind::MinusEq ||
         k == TokenKind::StarEq || k == TokenKind::SlashEq;
}

[[nodiscard]] AssignOp to_assign_op(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::PlusEq:
      return AssignOp::AddAssign;
    case TokenKind::MinusEq:
      return AssignOp::SubAssign;
    case TokenKind::StarEq:
      return AssignOp::MulAssign;
    case TokenKind::SlashEq:
      return AssignOp::DivAssign;
    default:
      return AssignOp::Assign;
  }
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

SourceRange Parser::prev_range() const
{
  return idx_ > 0 ? tokens_[idx_ - 1].range : cur().range;
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }

  // A missing `;` is reported at the end of the previous token.
  if (k == TokenKind::Semicolon && idx_ > 0) {
    const Token & prev = tokens_[idx_ - 1];
    const SourceRange at_end(file_id_, prev.end(), prev.end());
    diags_
      .report_error(
        prev.range, "expected " + std::string(what) + ", found " + describe(cur()),
        "expected `;` after this")
      .with_code(diag_code::k_syntax_error)
      .with_fixit(at_end, ";");
    return false;
  }

  error_at(cur(), "expected " + std::string(what) + ", found " + describe(cur()));
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  diags_.report_error(t.range, std::string(msg)).with_code(diag_code::k_syntax_error);
}

void Parser::synchronize_to_stmt()
{
  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      return;
    }
    if (at(TokenKind::RBrace)) {
      return;
    }
    if (
      is_kw("return", cur()) || is_kw("let", cur()) || is_kw("const", cur()) ||
      is_kw("if", cur()) || is_kw("for", cur())) {
      return;
    }
    advance();
  }
}

void Parser::synchronize_to_decl()
{
  int depth = 0;
  while (!at_eof()) {
    if (
      depth == 0 && (is_kw("import", cur()) || is_kw("circuit", cur()) ||
                     is_kw("record", cur()) || is_kw("function", cur()))) {
      return;
    }
    if (at(TokenKind::LBrace)) {
      ++depth;
    } else if (at(TokenKind::RBrace) && depth > 0) {
      --depth;
    }
    advance();
  }
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && t.text == kw;
}

bool Parser::is_reserved_ident(std::string_view ident)
{
  static constexpr std::string_view k_reserved[] = {
    "import", "circuit", "record", "function", "return", "let",     "const", "if",
    "else",   "for",     "in",     "as",       "public", "private", "true",  "false",
  };
  if (std::find(std::begin(k_reserved), std::end(k_reserved), ident) != std::end(k_reserved)) {
    return true;
  }
  return primitive_from_keyword(ident).has_value();
}

bool Parser::expect_identifier_not_reserved(std::string_view what)
{
  const Token & t = cur();
  if (t.kind != TokenKind::Identifier) {
    error_at(t, "expected " + std::string(what) + ", found " + describe(t));
    return false;
  }

  bool ok = true;
  if (is_reserved_ident(t.text)) {
    error_at(t, "keyword `" + std::string(t.text) + "` cannot be used as " + std::string(what));
    ok = false;
  }

  // Always consume one token so parsing can continue.
  advance();
  return ok;
}

// ============================================================================
// Program
// ============================================================================

Program * Parser::parse_program(std::string_view program_name)
{
  std::vector<ImportDecl *> imports;
  std::vector<CircuitDecl *> circuits;
  std::vector<FunctionDecl *> functions;

  while (!at_eof()) {
    if (is_kw("import", cur())) {
      if (auto * d = parse_import_decl()) imports.push_back(d);
      continue;
    }
    if (is_kw("circuit", cur()) || is_kw("record", cur())) {
      if (auto * d = parse_circuit_decl()) circuits.push_back(d);
      continue;
    }
    if (is_kw("function", cur())) {
      if (auto * d = parse_function_decl()) functions.push_back(d);
      continue;
    }

    error_at(
      cur(), "expected `import`, `circuit`, `record` or `function`, found " + describe(cur()));
    advance();
    synchronize_to_decl();
  }

  const SourceRange whole(file_id_, 0, static_cast<uint32_t>(source_.content().size()));
  return ast_.create<Program>(
    ast_.intern(program_name), ast_.copy_to_arena(imports), ast_.copy_to_arena(circuits),
    ast_.copy_to_arena(functions), whole);
}

// ============================================================================
// Imports
// ============================================================================

ImportDecl * Parser::parse_import_decl()
{
  const Token & kw = advance();

  const Package * package = parse_package();
  if (package == nullptr) {
    synchronize_to_stmt();
    return nullptr;
  }

  expect(TokenKind::Semicolon, "`;` after import");
  return ast_.create<ImportDecl>(package, join_ranges(kw.range, prev_range()));
}

std::string_view Parser::parse_package_name(SourceRange & range)
{
  const Token & first = cur();
  if (first.kind != TokenKind::Identifier) {
    error_at(first, "expected package name, found " + describe(first));
    return {};
  }
  advance();

  // Package names may contain dashes: `foo-bar`. Only adjacent tokens join.
  uint32_t end = first.end();
  while (at(TokenKind::Minus) && cur().begin() == end &&
         (cur(1).kind == TokenKind::Identifier || cur(1).kind == TokenKind::IntLiteral) &&
         cur(1).begin() == cur().end()) {
    advance();
    end = advance().end();
  }

  range = SourceRange(file_id_, first.begin(), end);
  return ast_.intern(source_.content().substr(first.begin(), end - first.begin()));
}

Package * Parser::parse_package()
{
  SourceRange name_range;
  const std::string_view name = parse_package_name(name_range);
  if (name.empty()) {
    return nullptr;
  }
  if (!expect(TokenKind::Dot, "`.` after package name")) {
    return nullptr;
  }

  const PackageAccess * access = parse_package_access();
  if (access == nullptr) {
    return nullptr;
  }
  return ast_.create<Package>(
    name, name_range, access, join_ranges(name_range, access->get_range()));
}

PackageAccess * Parser::parse_package_access()
{
  if (at(TokenKind::Star)) {
    const Token & star = advance();
    return ast_.create<PackageAccess>(StarAccess{star.range}, star.range);
  }

  if (at(TokenKind::LParen)) {
    const Token & open = advance();
    std::vector<const PackageAccess *> items;
    while (!at(TokenKind::RParen) && !at_eof()) {
      const PackageAccess * item = parse_package_access();
      if (item == nullptr) {
        return nullptr;
      }
      items.push_back(item);
      if (!match(TokenKind::Comma)) {
        break;
      }
    }
    if (!expect(TokenKind::RParen, "`)` to close import list")) {
      return nullptr;
    }
    const SourceRange range = join_ranges(open.range, prev_range());
    if (items.empty()) {
      diags_.report_error(range, "empty import list").with_code(diag_code::k_syntax_error);
      return nullptr;
    }
    return ast_.create<PackageAccess>(MultipleAccess{ast_.copy_to_arena(items)}, range);
  }

  if (at(TokenKind::Identifier)) {
    SourceRange name_range;
    const std::string_view name = parse_package_name(name_range);

    if (match(TokenKind::Dot)) {
      const PackageAccess * nested = parse_package_access();
      if (nested == nullptr) {
        return nullptr;
      }
      const SourceRange range = join_ranges(name_range, nested->get_range());
      const auto * package = ast_.create<Package>(name, name_range, nested, range);
      return ast_.create<PackageAccess>(SubPackageAccess{package}, range);
    }

    if (name.find('-') != std::string_view::npos) {
      diags_.report_error(name_range, "imported symbol names cannot contain `-`")
        .with_code(diag_code::k_syntax_error);
      return nullptr;
    }

    std::optional<std::string_view> alias;
    if (is_kw("as", cur())) {
      advance();
      const Token & alias_tok = cur();
      if (!expect_identifier_not_reserved("import alias")) {
        return nullptr;
      }
      alias = ast_.intern(alias_tok.text);
    }

    const SourceRange range = join_ranges(name_range, prev_range());
    return ast_.create<PackageAccess>(SymbolAccess{name, alias, range}, range);
  }

  error_at(cur(), "expected `*`, `(` or a name in import path, found " + describe(cur()));
  return nullptr;
}

// ============================================================================
// Circuits and records
// ============================================================================

CircuitDecl * Parser::parse_circuit_decl()
{
  const Token & kw = advance();
  const bool is_record = kw.text == "record";

  const Token & name_tok = cur();
  if (!expect_identifier_not_reserved(is_record ? "record name" : "circuit name")) {
    synchronize_to_decl();
    return nullptr;
  }
  if (!expect(TokenKind::LBrace, "`{`")) {
    synchronize_to_decl();
    return nullptr;
  }

  std::vector<CircuitMember *> members;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    if (auto * m = parse_circuit_member()) {
      members.push_back(m);
    } else {
      while (!at_eof() && !at(TokenKind::Comma) && !at(TokenKind::Semicolon) &&
             !at(TokenKind::RBrace)) {
        advance();
      }
    }
    if (!match(TokenKind::Comma) && !match(TokenKind::Semicolon)) {
      break;
    }
  }
  expect(TokenKind::RBrace, "`}` to close member list");

  return ast_.create<CircuitDecl>(
    ast_.intern(name_tok.text), name_tok.range, ast_.copy_to_arena(members), is_record,
    join_ranges(kw.range, prev_range()));
}

CircuitMember * Parser::parse_circuit_member()
{
  const Token & name_tok = cur();
  if (!expect_identifier_not_reserved("member name")) {
    return nullptr;
  }
  if (!expect(TokenKind::Colon, "`:` after member name")) {
    return nullptr;
  }
  TypeNode * type = parse_type();
  return ast_.create<CircuitMember>(
    ast_.intern(name_tok.text), type, join_ranges(name_tok.range, type->get_range()));
}

// ============================================================================
// Functions
// ============================================================================

FunctionDecl * Parser::parse_function_decl()
{
  const Token & kw = advance();

  const Token & name_tok = cur();
  if (!expect_identifier_not_reserved("function name")) {
    synchronize_to_decl();
    return nullptr;
  }
  if (!expect(TokenKind::LParen, "`(` after function name")) {
    synchronize_to_decl();
    return nullptr;
  }

  std::vector<FunctionInput *> inputs;
  while (!at(TokenKind::RParen) && !at_eof()) {
    if (auto * input = parse_function_input()) {
      inputs.push_back(input);
    }
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  if (!expect(TokenKind::RParen, "`)` to close input list")) {
    synchronize_to_decl();
    return nullptr;
  }

  TypeNode * output = nullptr;
  if (match(TokenKind::Arrow)) {
    output = parse_type();
  }

  if (!at(TokenKind::LBrace)) {
    error_at(cur(), "expected `{` to start function body, found " + describe(cur()));
    synchronize_to_decl();
    return nullptr;
  }
  BlockStmt * body = parse_block();

  return ast_.create<FunctionDecl>(
    ast_.intern(name_tok.text), name_tok.range, ast_.copy_to_arena(inputs), output, body,
    join_ranges(kw.range, body->get_range()));
}

FunctionInput * Parser::parse_function_input()
{
  const Token & first = cur();
  InputMode mode = InputMode::Private;
  if (is_kw("public", cur())) {
    mode = InputMode::Public;
    advance();
  } else if (is_kw("private", cur())) {
    advance();
  } else if (is_kw("const", cur())) {
    mode = InputMode::Constant;
    advance();
  }

  const Token & name_tok = cur();
  if (!expect_identifier_not_reserved("input name")) {
    return nullptr;
  }
  if (!expect(TokenKind::Colon, "`:` after input name")) {
    return nullptr;
  }
  TypeNode * type = parse_type();
  return ast_.create<FunctionInput>(
    ast_.intern(name_tok.text), name_tok.range, mode, type,
    join_ranges(first.range, type->get_range()));
}

// ============================================================================
// Types
// ============================================================================

TypeNode * Parser::parse_type()
{
  if (at(TokenKind::LBracket)) {
    return parse_array_type();
  }

  if (at(TokenKind::LParen)) {
    const Token & open = advance();
    std::vector<TypeNode *> elements;
    while (!at(TokenKind::RParen) && !at_eof()) {
      elements.push_back(parse_type());
      if (!match(TokenKind::Comma)) {
        break;
      }
    }
    expect(TokenKind::RParen, "`)` to close tuple type");
    return ast_.create<TupleType>(
      ast_.copy_to_arena(elements), join_ranges(open.range, prev_range()));
  }

  if (at(TokenKind::Identifier)) {
    const Token & t = advance();
    if (const auto prim = primitive_from_keyword(t.text)) {
      return ast_.create<PrimitiveType>(*prim, t.range);
    }
    return ast_.create<NamedType>(ast_.intern(t.text), t.range);
  }

  error_at(cur(), "expected a type, found " + describe(cur()));
  return ast_.create<MissingType>(cur().range);
}

TypeNode * Parser::parse_array_type()
{
  const Token & open = advance();
  TypeNode * element = parse_type();

  if (!expect(TokenKind::Semicolon, "`;` in array type")) {
    return ast_.create<MissingType>(join_ranges(open.range, prev_range()));
  }

  std::vector<uint64_t> dims;
  const auto parse_dim = [&]() -> bool {
    const Token & t = cur();
    uint64_t value = 0;
    const char * first = t.text.data();
    const char * last = t.text.data() + t.text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (t.kind != TokenKind::IntLiteral || ec != std::errc{} || ptr != last) {
      error_at(t, "expected array dimension, found " + describe(t));
      if (!at(TokenKind::RBracket) && !at(TokenKind::RParen) && !at_eof()) {
        advance();
      }
      return false;
    }
    advance();
    dims.push_back(value);
    return true;
  };

  bool ok = true;
  if (match(TokenKind::LParen)) {
    while (ok && !at(TokenKind::RParen) && !at_eof()) {
      ok = parse_dim();
      if (!match(TokenKind::Comma)) {
        break;
      }
    }
    ok = expect(TokenKind::RParen, "`)` to close dimension list") && ok && !dims.empty();
  } else {
    ok = parse_dim();
  }
  const bool closed = expect(TokenKind::RBracket, "`]` to close array type");

  const SourceRange range = join_ranges(open.range, prev_range());
  if (!ok || !closed) {
    return ast_.create<MissingType>(range);
  }
  return ast_.create<ArrayType>(element, ast_.copy_to_arena(dims), range);
}

// ============================================================================
// Statements
// ============================================================================

BlockStmt * Parser::parse_block()
{
  const Token & open = cur();
  if (!expect(TokenKind::LBrace, "`{`")) {
    return ast_.create<BlockStmt>(gsl::span<Stmt *>{}, open.range);
  }

  std::vector<Stmt *> statements;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const size_t before = idx_;
    if (Stmt * s = parse_stmt()) {
      statements.push_back(s);
    }
    if (idx_ == before) {
      advance();
    }
  }
  expect(TokenKind::RBrace, "`}` to close block");

  return ast_.create<BlockStmt>(
    ast_.copy_to_arena(statements), join_ranges(open.range, prev_range()));
}

Stmt * Parser::parse_stmt()
{
  if (is_kw("return", cur())) return parse_return_stmt();
  if (is_kw("let", cur()) || is_kw("const", cur())) return parse_definition_stmt();
  if (is_kw("if", cur())) return parse_conditional_stmt();
  if (is_kw("for", cur())) return parse_iteration_stmt();
  if (at(TokenKind::LBrace)) return parse_block();
  return parse_assign_or_expr_stmt();
}

ReturnStmt * Parser::parse_return_stmt()
{
  const Token & kw = advance();
  Expr * value = nullptr;
  if (!at(TokenKind::Semicolon)) {
    value = parse_expr();
  }
  if (!expect(TokenKind::Semicolon, "`;` after return")) {
    synchronize_to_stmt();
  }
  return ast_.create<ReturnStmt>(value, join_ranges(kw.range, prev_range()));
}

DefinitionStmt * Parser::parse_definition_stmt()
{
  const Token & kw = advance();
  const DefinitionKind kind = kw.text == "let" ? DefinitionKind::Let : DefinitionKind::Const;

  const Token & name_tok = cur();
  if (!expect_identifier_not_reserved("variable name")) {
    synchronize_to_stmt();
    return nullptr;
  }

  TypeNode * type = nullptr;
  if (match(TokenKind::Colon)) {
    type = parse_type();
  }

  if (!expect(TokenKind::Eq, "`=` in definition")) {
    synchronize_to_stmt();
    return nullptr;
  }
  Expr * value = parse_expr();
  if (!expect(TokenKind::Semicolon, "`;` after definition")) {
    synchronize_to_stmt();
  }

  return ast_.create<DefinitionStmt>(
    kind, ast_.intern(name_tok.text), type, value, join_ranges(kw.range, prev_range()));
}

ConditionalStmt * Parser::parse_conditional_stmt()
{
  const Token & kw = advance();
  Expr * condition = parse_expr();
  BlockStmt * then_block = parse_block();

  Stmt * otherwise = nullptr;
  if (is_kw("else", cur())) {
    advance();
    if (is_kw("if", cur())) {
      otherwise = parse_conditional_stmt();
    } else {
      otherwise = parse_block();
    }
  }

  return ast_.create<ConditionalStmt>(
    condition, then_block, otherwise, join_ranges(kw.range, prev_range()));
}

IterationStmt * Parser::parse_iteration_stmt()
{
  const Token & kw = advance();

  const Token & var_tok = cur();
  if (!expect_identifier_not_reserved("loop variable")) {
    synchronize_to_stmt();
    return nullptr;
  }

  TypeNode * type = nullptr;
  if (match(TokenKind::Colon)) {
    type = parse_type();
  }

  if (!is_kw("in", cur())) {
    error_at(cur(), "expected `in` after loop variable, found " + describe(cur()));
    synchronize_to_stmt();
    return nullptr;
  }
  advance();

  Expr * start = parse_expr();
  if (!expect(TokenKind::DotDot, "`..` in loop range")) {
    synchronize_to_stmt();
    return nullptr;
  }
  Expr * stop = parse_expr();
  BlockStmt * body = parse_block();

  return ast_.create<IterationStmt>(
    ast_.intern(var_tok.text), type, start, stop, body, join_ranges(kw.range, prev_range()));
}

Stmt * Parser::parse_assign_or_expr_stmt()
{
  const Token & first = cur();
  Expr * expr = parse_expr();

  if (is_assign_op(cur().kind)) {
    const AssignOp op = to_assign_op(advance().kind);
    Expr * value = parse_expr();
    if (!expect(TokenKind::Semicolon, "`;` after assignment")) {
      synchronize_to_stmt();
    }
    return ast_.create<AssignStmt>(expr, op, value, join_ranges(first.range, prev_range()));
  }

  if (!expect(TokenKind::Semicolon, "`;` after expression")) {
    synchronize_to_stmt();
  }
  return ast_.create<ExpressionStmt>(expr, join_ranges(first.range, prev_range()));
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr() { return parse_or(); }

Expr * Parser::parse_or()
{
  Expr * lhs = parse_and();
  while (at(TokenKind::OrOr)) {
    advance();
    Expr * rhs = parse_and();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Or, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  Expr * lhs = parse_equality();
  while (at(TokenKind::AndAnd)) {
    advance();
    Expr * rhs = parse_equality();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::And, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_equality()
{
  Expr * lhs = parse_comparison();
  while (at(TokenKind::EqEq) || at(TokenKind::Ne)) {
    const BinaryOp op = advance().kind == TokenKind::EqEq ? BinaryOp::Eq : BinaryOp::Ne;
    Expr * rhs = parse_comparison();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_comparison()
{
  Expr * lhs = parse_add();
  while (at(TokenKind::Lt) || at(TokenKind::Le) || at(TokenKind::Gt) || at(TokenKind::Ge)) {
    BinaryOp op = BinaryOp::Lt;
    switch (advance().kind) {
      case TokenKind::Le:
        op = BinaryOp::Le;
        break;
      case TokenKind::Gt:
        op = BinaryOp::Gt;
        break;
      case TokenKind::Ge:
        op = BinaryOp::Ge;
        break;
      default:
        break;
    }
    Expr * rhs = parse_add();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_add()
{
  Expr * lhs = parse_mul();
  while (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const BinaryOp op = advance().kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Sub;
    Expr * rhs = parse_mul();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_mul()
{
  Expr * lhs = parse_pow();
  while (at(TokenKind::Star) || at(TokenKind::Slash)) {
    const BinaryOp op = advance().kind == TokenKind::Star ? BinaryOp::Mul : BinaryOp::Div;
    Expr * rhs = parse_pow();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_pow()
{
  Expr * lhs = parse_unary();
  if (match(TokenKind::StarStar)) {
    Expr * rhs = parse_pow();  // right-associative
    return ast_.create<BinaryExpr>(
      lhs, BinaryOp::Pow, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_unary()
{
  if (at(TokenKind::Bang) || at(TokenKind::Minus)) {
    const Token & op_tok = advance();
    const UnaryOp op = op_tok.kind == TokenKind::Bang ? UnaryOp::Not : UnaryOp::Negate;
    Expr * operand = parse_unary();
    return ast_.create<UnaryExpr>(op, operand, join_ranges(op_tok.range, operand->get_range()));
  }
  return parse_postfix();
}

Expr * Parser::parse_postfix()
{
  Expr * expr = parse_primary();
  while (true) {
    if (at(TokenKind::LParen)) {
      advance();
      std::vector<Expr *> args;
      while (!at(TokenKind::RParen) && !at_eof()) {
        args.push_back(parse_expr());
        if (!match(TokenKind::Comma)) {
          break;
        }
      }
      expect(TokenKind::RParen, "`)` to close argument list");
      expr = ast_.create<CallExpr>(
        expr, ast_.copy_to_arena(args), join_ranges(expr->get_range(), prev_range()));
      continue;
    }
    if (at(TokenKind::Dot)) {
      advance();
      const Token & member = cur();
      if (member.kind != TokenKind::Identifier && member.kind != TokenKind::IntLiteral) {
        error_at(member, "expected member name after `.`, found " + describe(member));
        return expr;
      }
      advance();
      expr = ast_.create<MemberExpr>(
        expr, ast_.intern(member.text), join_ranges(expr->get_range(), member.range));
      continue;
    }
    return expr;
  }
}

Expr * Parser::parse_primary()
{
  const Token & t = cur();
  switch (t.kind) {
    case TokenKind::IntLiteral:
      advance();
      return ast_.create<IntLiteralExpr>(ast_.intern(t.text), t.range);
    case TokenKind::StringLiteral:
      advance();
      return ast_.create<StringLiteralExpr>(ast_.intern(t.text), t.range);
    case TokenKind::Identifier:
      if (t.text == "true" || t.text == "false") {
        advance();
        return ast_.create<BoolLiteralExpr>(t.text == "true", t.range);
      }
      advance();
      return ast_.create<PathExpr>(ast_.intern(t.text), t.range);
    case TokenKind::LParen: {
      advance();
      Expr * inner = parse_expr();
      expect(TokenKind::RParen, "`)`");
      return inner;
    }
    default:
      return make_missing_expr_at(t);
  }
}

Expr * Parser::make_missing_expr_at(const Token & t)
{
  error_at(t, "expected expression, found " + describe(t));
  return ast_.create<MissingExpr>(t.range);
}

}  // namespace circ_dsl::syntax
