// circ_dsl/ast/ast_enums.cpp - Enum name tables
#include "circ_dsl/ast/ast_enums.hpp"

#include <array>
#include <utility>

namespace circ_dsl
{

std::optional<PrimitiveKind> primitive_from_keyword(std::string_view word) noexcept
{
  static constexpr std::array<std::pair<std::string_view, PrimitiveKind>, 16> k_keywords = {{
    {"address", PrimitiveKind::Address},
    {"bool", PrimitiveKind::Bool},
    {"field", PrimitiveKind::Field},
    {"group", PrimitiveKind::Group},
    {"scalar", PrimitiveKind::Scalar},
    {"string", PrimitiveKind::String},
    {"i8", PrimitiveKind::I8},
    {"i16", PrimitiveKind::I16},
    {"i32", PrimitiveKind::I32},
    {"i64", PrimitiveKind::I64},
    {"i128", PrimitiveKind::I128},
    {"u8", PrimitiveKind::U8},
    {"u16", PrimitiveKind::U16},
    {"u32", PrimitiveKind::U32},
    {"u64", PrimitiveKind::U64},
    {"u128", PrimitiveKind::U128},
  }};

  for (const auto & [kw, kind] : k_keywords) {
    if (kw == word) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Pow:
      return "**";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
  }
  return "?";
}

std::string_view to_string(UnaryOp op) noexcept
{
  return op == UnaryOp::Not ? "!" : "-";
}

std::string_view to_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Assign:
      return "=";
    case AssignOp::AddAssign:
      return "+=";
    case AssignOp::SubAssign:
      return "-=";
    case AssignOp::MulAssign:
      return "*=";
    case AssignOp::DivAssign:
      return "/=";
  }
  return "=";
}

}  // namespace circ_dsl
