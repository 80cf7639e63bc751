// tests/unit/sema/test_type_utils.cpp - Unit tests for type equality and spelling
//

#include <gtest/gtest.h>

#include "circ_dsl/sema/type_utils.hpp"
#include "circ_dsl/test_support/parse_helpers.hpp"

using namespace circ_dsl;
using circ_dsl::test_support::parse;

namespace
{

// Member types of the single circuit in `src`, in declaration order.
struct MemberTypes
{
  test_support::TestParseUnit unit;

  explicit MemberTypes(std::string src) : unit(parse(std::move(src))) {}

  [[nodiscard]] const TypeNode * operator[](size_t i) const
  {
    return unit.program->circuits[0]->members[i]->type;
  }
};

}  // namespace

TEST(SemaTypeUtils, NestedArraysEqualMultiDimensional)
{
  const MemberTypes t("circuit C { a: [[u8; 3]; 2], b: [u8; (2, 3)], c: [u8; (3, 2)] }");
  ASSERT_FALSE(t.unit.diags.has_errors());

  EXPECT_TRUE(types_equal_flat(t[0], t[1]));
  EXPECT_TRUE(types_equal_flat(t[1], t[0]));
  EXPECT_FALSE(types_equal_flat(t[1], t[2]));
}

TEST(SemaTypeUtils, PrimitivesNamedAndTuples)
{
  const MemberTypes t(
    "circuit C { a: u64, b: u64, c: u32, d: Point, e: Point, f: (u8, bool), g: (u8, bool), "
    "h: (u8, field) }");
  ASSERT_FALSE(t.unit.diags.has_errors());

  EXPECT_TRUE(types_equal_flat(t[0], t[1]));
  EXPECT_FALSE(types_equal_flat(t[0], t[2]));
  EXPECT_TRUE(types_equal_flat(t[3], t[4]));
  EXPECT_FALSE(types_equal_flat(t[0], t[3]));
  EXPECT_TRUE(types_equal_flat(t[5], t[6]));
  EXPECT_FALSE(types_equal_flat(t[5], t[7]));
}

TEST(SemaTypeUtils, MissingTypeEqualsNothing)
{
  const MemberTypes t("circuit C { a: [u8; n], b: [u8; n] }");
  ASSERT_TRUE(t.unit.diags.has_errors());
  ASSERT_TRUE(isa<MissingType>(t[0]));

  EXPECT_FALSE(types_equal_flat(t[0], t[0]));
  EXPECT_FALSE(types_equal_flat(t[0], t[1]));
  EXPECT_FALSE(types_equal_flat(nullptr, nullptr));
}

TEST(SemaTypeUtils, Spelling)
{
  const MemberTypes t("circuit C { a: [u8; (2, 3)], b: [field; 4], c: (u8, Point), d: address }");
  ASSERT_FALSE(t.unit.diags.has_errors());

  EXPECT_EQ(type_to_string(t[0]), "[u8; (2, 3)]");
  EXPECT_EQ(type_to_string(t[1]), "[field; 4]");
  EXPECT_EQ(type_to_string(t[2]), "(u8, Point)");
  EXPECT_EQ(type_to_string(t[3]), "address");
  EXPECT_EQ(type_to_string(nullptr), "()");
}
