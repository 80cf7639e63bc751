// circ_dsl/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators, input modes and primitive type kinds.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace circ_dsl
{

// ============================================================================
// NodeKind
// ============================================================================

/**
 * Node kind enumeration for classof-based RTTI.
 * Kinds are grouped by category so category checks are range comparisons.
 */
enum class NodeKind : uint8_t {
  // === Expressions ===
  IntLiteral,
  BoolLiteral,
  StringLiteral,
  Path,
  Binary,
  Unary,
  Call,
  Member,
  MissingExpr,

  // === Types ===
  PrimitiveType,
  NamedType,
  ArrayType,
  TupleType,
  MissingType,

  // === Statements ===
  BlockStmt,
  ReturnStmt,
  DefinitionStmt,
  AssignStmt,
  ConditionalStmt,
  IterationStmt,
  ExpressionStmt,

  // === Declarations ===
  ImportDecl,
  CircuitDecl,
  FunctionDecl,

  // === Supporting nodes ===
  FunctionInput,
  CircuitMember,
  Package,
  PackageAccess,

  // === Top-level ===
  Program,
};

[[nodiscard]] constexpr bool is_expr_kind(NodeKind k) noexcept
{
  return k >= NodeKind::IntLiteral && k <= NodeKind::MissingExpr;
}

[[nodiscard]] constexpr bool is_type_kind(NodeKind k) noexcept
{
  return k >= NodeKind::PrimitiveType && k <= NodeKind::MissingType;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind k) noexcept
{
  return k >= NodeKind::BlockStmt && k <= NodeKind::ExpressionStmt;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind k) noexcept
{
  return k >= NodeKind::ImportDecl && k <= NodeKind::FunctionDecl;
}

// ============================================================================
// Function inputs
// ============================================================================

/// Visibility mode of a function input. Inputs without a keyword are private.
enum class InputMode : uint8_t {
  Private,
  Public,
  Constant,
};

[[nodiscard]] constexpr std::string_view to_string(InputMode m) noexcept
{
  switch (m) {
    case InputMode::Private:
      return "private";
    case InputMode::Public:
      return "public";
    case InputMode::Constant:
      return "const";
  }
  return "private";
}

// ============================================================================
// Primitive types
// ============================================================================

enum class PrimitiveKind : uint8_t {
  Address,
  Bool,
  Field,
  Group,
  Scalar,
  String,
  I8,
  I16,
  I32,
  I64,
  I128,
  U8,
  U16,
  U32,
  U64,
  U128,
};

[[nodiscard]] constexpr std::string_view to_string(PrimitiveKind k) noexcept
{
  switch (k) {
    case PrimitiveKind::Address:
      return "address";
    case PrimitiveKind::Bool:
      return "bool";
    case PrimitiveKind::Field:
      return "field";
    case PrimitiveKind::Group:
      return "group";
    case PrimitiveKind::Scalar:
      return "scalar";
    case PrimitiveKind::String:
      return "string";
    case PrimitiveKind::I8:
      return "i8";
    case PrimitiveKind::I16:
      return "i16";
    case PrimitiveKind::I32:
      return "i32";
    case PrimitiveKind::I64:
      return "i64";
    case PrimitiveKind::I128:
      return "i128";
    case PrimitiveKind::U8:
      return "u8";
    case PrimitiveKind::U16:
      return "u16";
    case PrimitiveKind::U32:
      return "u32";
    case PrimitiveKind::U64:
      return "u64";
    case PrimitiveKind::U128:
      return "u128";
  }
  return "<unknown>";
}

/// Keyword to primitive kind, e.g. "u64" -> U64.
[[nodiscard]] std::optional<PrimitiveKind> primitive_from_keyword(std::string_view word) noexcept;

[[nodiscard]] constexpr bool is_integer(PrimitiveKind k) noexcept
{
  return k >= PrimitiveKind::I8 && k <= PrimitiveKind::U128;
}

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Pow,  ///< **
  Eq,   ///< ==
  Ne,   ///< !=
  Lt,   ///< <
  Le,   ///< <=
  Gt,   ///< >
  Ge,   ///< >=
  And,  ///< &&
  Or,   ///< ||
};

enum class UnaryOp : uint8_t {
  Not,     ///< !
  Negate,  ///< -
};

enum class AssignOp : uint8_t {
  Assign,     ///< =
  AddAssign,  ///< +=
  SubAssign,  ///< -=
  MulAssign,  ///< *=
  DivAssign,  ///< /=
};

/// `let` or `const` local definition.
enum class DefinitionKind : uint8_t {
  Let,
  Const,
};

[[nodiscard]] std::string_view to_string(BinaryOp op) noexcept;
[[nodiscard]] std::string_view to_string(UnaryOp op) noexcept;
[[nodiscard]] std::string_view to_string(AssignOp op) noexcept;

}  // namespace circ_dsl
