// circ_dsl/ast/ast.hpp - AST node class definitions
//
// Nodes follow the LLVM/Clang style: a NodeKind tag plus classof() for RTTI.
// All nodes are arena-allocated by AstContext and must stay trivially
// destructible, so strings are std::string_view and lists are gsl::span.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>
#include <variant>

#include "circ_dsl/ast/ast_enums.hpp"
#include "circ_dsl/basic/casting.hpp"
#include "circ_dsl/basic/source_manager.hpp"

namespace circ_dsl
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Nodes are non-copyable and owned by an AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base that supplies classof() for a concrete node kind.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind_value = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class TypeNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Integer or field literal; `text` keeps the type suffix (e.g. `10u32`).
class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  std::string_view text;

  explicit IntLiteralExpr(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Reference to a variable, function or circuit by name.
class PathExpr : public NodeBase<PathExpr, Expr, NodeKind::Path>
{
public:
  std::string_view name;

  explicit PathExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * rr, SourceRange r = {})
  : NodeBase(r), lhs(l), op(o), rhs(rr)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::Unary>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::Call>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;

  CallExpr(Expr * c, gsl::span<Expr *> a, SourceRange r = {}) : NodeBase(r), callee(c), args(a) {}
};

/// `base.member`; tuple indices (`t.0`) are stored as their digit text.
class MemberExpr : public NodeBase<MemberExpr, Expr, NodeKind::Member>
{
public:
  Expr * base;
  std::string_view member;

  MemberExpr(Expr * b, std::string_view m, SourceRange r = {}) : NodeBase(r), base(b), member(m)
  {
  }
};

/// Parser recovery placeholder.
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::MissingExpr>
{
public:
  explicit MissingExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Type Nodes
// ============================================================================

class PrimitiveType : public NodeBase<PrimitiveType, TypeNode, NodeKind::PrimitiveType>
{
public:
  PrimitiveKind primitive;

  explicit PrimitiveType(PrimitiveKind p, SourceRange r = {}) : NodeBase(r), primitive(p) {}
};

/// Reference to a circuit or record type by name.
class NamedType : public NodeBase<NamedType, TypeNode, NodeKind::NamedType>
{
public:
  std::string_view name;

  explicit NamedType(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `[T; N]` or `[T; (N, M, ...)]`.
class ArrayType : public NodeBase<ArrayType, TypeNode, NodeKind::ArrayType>
{
public:
  TypeNode * element;
  gsl::span<uint64_t> dimensions;

  ArrayType(TypeNode * e, gsl::span<uint64_t> dims, SourceRange r = {})
  : NodeBase(r), element(e), dimensions(dims)
  {
  }
};

class TupleType : public NodeBase<TupleType, TypeNode, NodeKind::TupleType>
{
public:
  gsl::span<TypeNode *> elements;

  explicit TupleType(gsl::span<TypeNode *> e, SourceRange r = {}) : NodeBase(r), elements(e) {}
};

/// Parser recovery placeholder; never equal to any type.
class MissingType : public NodeBase<MissingType, TypeNode, NodeKind::MissingType>
{
public:
  explicit MissingType(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::BlockStmt>
{
public:
  gsl::span<Stmt *> statements;

  explicit BlockStmt(gsl::span<Stmt *> s, SourceRange r = {}) : NodeBase(r), statements(s) {}
};

/// `return expr;` (`value` is nullptr for a bare `return;`).
class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * value;

  explicit ReturnStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `let x: T = e;` / `const x = e;`
class DefinitionStmt : public NodeBase<DefinitionStmt, Stmt, NodeKind::DefinitionStmt>
{
public:
  DefinitionKind definition;
  std::string_view name;
  TypeNode * type;  ///< nullptr when omitted
  Expr * value;

  DefinitionStmt(
    DefinitionKind d, std::string_view n, TypeNode * t, Expr * v, SourceRange r = {})
  : NodeBase(r), definition(d), name(n), type(t), value(v)
  {
  }
};

class AssignStmt : public NodeBase<AssignStmt, Stmt, NodeKind::AssignStmt>
{
public:
  Expr * target;
  AssignOp op;
  Expr * value;

  AssignStmt(Expr * t, AssignOp o, Expr * v, SourceRange r = {})
  : NodeBase(r), target(t), op(o), value(v)
  {
  }
};

/// `if cond { ... } else ...`; `otherwise` is a BlockStmt, a nested
/// ConditionalStmt, or nullptr.
class ConditionalStmt : public NodeBase<ConditionalStmt, Stmt, NodeKind::ConditionalStmt>
{
public:
  Expr * condition;
  BlockStmt * then_block;
  Stmt * otherwise;

  ConditionalStmt(Expr * c, BlockStmt * t, Stmt * o, SourceRange r = {})
  : NodeBase(r), condition(c), then_block(t), otherwise(o)
  {
  }
};

/// `for i: T in start..stop { ... }`
class IterationStmt : public NodeBase<IterationStmt, Stmt, NodeKind::IterationStmt>
{
public:
  std::string_view variable;
  TypeNode * type;  ///< nullptr when omitted
  Expr * start;
  Expr * stop;
  BlockStmt * body;

  IterationStmt(
    std::string_view v, TypeNode * t, Expr * s, Expr * e, BlockStmt * b, SourceRange r = {})
  : NodeBase(r), variable(v), type(t), start(s), stop(e), body(b)
  {
  }
};

class ExpressionStmt : public NodeBase<ExpressionStmt, Stmt, NodeKind::ExpressionStmt>
{
public:
  Expr * expr;

  explicit ExpressionStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

class FunctionInput : public NodeBase<FunctionInput, AstNode, NodeKind::FunctionInput>
{
public:
  std::string_view name;
  SourceRange name_range;
  InputMode mode;
  TypeNode * type;

  FunctionInput(
    std::string_view n, SourceRange nr, InputMode m, TypeNode * t, SourceRange r = {})
  : NodeBase(r), name(n), name_range(nr), mode(m), type(t)
  {
  }
};

class CircuitMember : public NodeBase<CircuitMember, AstNode, NodeKind::CircuitMember>
{
public:
  std::string_view name;
  TypeNode * type;

  CircuitMember(std::string_view n, TypeNode * t, SourceRange r = {})
  : NodeBase(r), name(n), type(t)
  {
  }
};

class Package;
class PackageAccess;

/// `foo.*`
struct StarAccess
{
  SourceRange range;
};

/// `foo.bar` or `foo.bar as baz`
struct SymbolAccess
{
  std::string_view symbol;
  std::optional<std::string_view> alias;
  SourceRange range;
};

/// `foo.sub.<access>`: `package` is searched under the matched entry of `foo`.
struct SubPackageAccess
{
  const Package * package;
};

/// `foo.(a, b as c, sub.*)`
struct MultipleAccess
{
  gsl::span<const PackageAccess *> accesses;
};

using PackageAccessKind = std::variant<StarAccess, SymbolAccess, SubPackageAccess, MultipleAccess>;

/// One access step in an import path.
class PackageAccess : public NodeBase<PackageAccess, AstNode, NodeKind::PackageAccess>
{
public:
  PackageAccessKind access;

  explicit PackageAccess(PackageAccessKind a, SourceRange r = {}) : NodeBase(r), access(a) {}
};

/// A package name followed by what to take from it.
class Package : public NodeBase<Package, AstNode, NodeKind::Package>
{
public:
  std::string_view name;
  SourceRange name_range;
  const PackageAccess * access;

  Package(std::string_view n, SourceRange nr, const PackageAccess * a, SourceRange r = {})
  : NodeBase(r), name(n), name_range(nr), access(a)
  {
  }
};

// ============================================================================
// Declaration Nodes
// ============================================================================

class ImportDecl : public NodeBase<ImportDecl, Decl, NodeKind::ImportDecl>
{
public:
  const Package * package;

  explicit ImportDecl(const Package * p, SourceRange r = {}) : NodeBase(r), package(p) {}
};

/// `circuit Name { ... }` or `record Name { ... }`.
class CircuitDecl : public NodeBase<CircuitDecl, Decl, NodeKind::CircuitDecl>
{
public:
  std::string_view name;
  SourceRange name_range;
  gsl::span<CircuitMember *> members;
  bool is_record;

  CircuitDecl(
    std::string_view n, SourceRange nr, gsl::span<CircuitMember *> m, bool record,
    SourceRange r = {})
  : NodeBase(r), name(n), name_range(nr), members(m), is_record(record)
  {
  }

  [[nodiscard]] const CircuitMember * find_member(std::string_view member) const noexcept
  {
    for (const CircuitMember * m : members) {
      if (m->name == member) return m;
    }
    return nullptr;
  }
};

class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::FunctionDecl>
{
public:
  std::string_view name;
  SourceRange name_range;
  gsl::span<FunctionInput *> inputs;
  TypeNode * output;  ///< nullptr when no `->` clause
  BlockStmt * body;

  FunctionDecl(
    std::string_view n, SourceRange nr, gsl::span<FunctionInput *> in, TypeNode * out,
    BlockStmt * b, SourceRange r = {})
  : NodeBase(r), name(n), name_range(nr), inputs(in), output(out), body(b)
  {
  }
};

// ============================================================================
// Program
// ============================================================================

/**
 * Root node of one source file.
 *
 * `name` starts as the file name without extension and is reassigned when the
 * program is merged into an importing scope.
 */
class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  std::string_view name;
  gsl::span<ImportDecl *> imports;
  gsl::span<CircuitDecl *> circuits;
  gsl::span<FunctionDecl *> functions;

  Program(
    std::string_view n, gsl::span<ImportDecl *> i, gsl::span<CircuitDecl *> c,
    gsl::span<FunctionDecl *> f, SourceRange r = {})
  : NodeBase(r), name(n), imports(i), circuits(c), functions(f)
  {
  }

  /// First circuit with the given name, in declaration order.
  [[nodiscard]] const CircuitDecl * find_circuit(std::string_view circuit) const noexcept
  {
    for (const CircuitDecl * c : circuits) {
      if (c->name == circuit) return c;
    }
    return nullptr;
  }

  /// First function with the given name, in declaration order.
  [[nodiscard]] const FunctionDecl * find_function(std::string_view function) const noexcept
  {
    for (const FunctionDecl * f : functions) {
      if (f->name == function) return f;
    }
    return nullptr;
  }
};

}  // namespace circ_dsl
