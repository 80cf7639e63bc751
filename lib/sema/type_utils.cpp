// circ_dsl/sema/type_utils.cpp - Structural helpers over type nodes
#include "circ_dsl/sema/type_utils.hpp"

#include <cstdint>
#include <vector>

#include "circ_dsl/basic/casting.hpp"

namespace circ_dsl
{
namespace
{

struct FlatArray
{
  const TypeNode * element = nullptr;
  std::vector<uint64_t> dimensions;
};

FlatArray flatten(const ArrayType * array)
{
  FlatArray out;
  const TypeNode * cur = array;
  while (const auto * arr = dyn_cast<ArrayType>(cur)) {
    out.dimensions.insert(out.dimensions.end(), arr->dimensions.begin(), arr->dimensions.end());
    cur = arr->element;
  }
  out.element = cur;
  return out;
}

}  // namespace

bool types_equal_flat(const TypeNode * a, const TypeNode * b)
{
  if (a == nullptr || b == nullptr) {
    return false;
  }
  if (a->get_kind() != b->get_kind()) {
    return false;
  }

  switch (a->get_kind()) {
    case NodeKind::PrimitiveType:
      return cast<PrimitiveType>(a)->primitive == cast<PrimitiveType>(b)->primitive;

    case NodeKind::NamedType:
      return cast<NamedType>(a)->name == cast<NamedType>(b)->name;

    case NodeKind::TupleType: {
      const auto * ta = cast<TupleType>(a);
      const auto * tb = cast<TupleType>(b);
      if (ta->elements.size() != tb->elements.size()) {
        return false;
      }
      for (size_t i = 0; i < ta->elements.size(); ++i) {
        if (!types_equal_flat(ta->elements[i], tb->elements[i])) {
          return false;
        }
      }
      return true;
    }

    case NodeKind::ArrayType: {
      const FlatArray fa = flatten(cast<ArrayType>(a));
      const FlatArray fb = flatten(cast<ArrayType>(b));
      return fa.dimensions == fb.dimensions && types_equal_flat(fa.element, fb.element);
    }

    default:
      return false;
  }
}

std::string type_to_string(const TypeNode * type)
{
  if (type == nullptr) {
    return "()";
  }

  switch (type->get_kind()) {
    case NodeKind::PrimitiveType:
      return std::string(to_string(cast<PrimitiveType>(type)->primitive));

    case NodeKind::NamedType:
      return std::string(cast<NamedType>(type)->name);

    case NodeKind::TupleType: {
      const auto * tuple = cast<TupleType>(type);
      std::string out = "(";
      for (size_t i = 0; i < tuple->elements.size(); ++i) {
        if (i > 0) out += ", ";
        out += type_to_string(tuple->elements[i]);
      }
      return out + ")";
    }

    case NodeKind::ArrayType: {
      const auto * array = cast<ArrayType>(type);
      std::string out = "[" + type_to_string(array->element) + "; ";
      if (array->dimensions.size() == 1) {
        out += std::to_string(array->dimensions[0]);
      } else {
        out += "(";
        for (size_t i = 0; i < array->dimensions.size(); ++i) {
          if (i > 0) out += ", ";
          out += std::to_string(array->dimensions[i]);
        }
        out += ")";
      }
      return out + "]";
    }

    default:
      return "<missing>";
  }
}

}  // namespace circ_dsl
