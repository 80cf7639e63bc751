// tests/unit/sema/test_type_checker.cpp - Unit tests for TypeChecker
//

#include <gtest/gtest.h>

#include <string>

#include "circ_dsl/basic/diagnostic_codes.hpp"
#include "circ_dsl/imports/program_context.hpp"
#include "circ_dsl/sema/type_checker.hpp"
#include "circ_dsl/test_support/parse_helpers.hpp"

using namespace circ_dsl;
using circ_dsl::test_support::parse;

namespace
{

struct CheckResult
{
  test_support::TestParseUnit unit;
  DiagnosticBag diags;
  bool ok = false;
  size_t error_count = 0;
};

CheckResult check_source(std::string src, const ProgramContext * definitions = nullptr)
{
  CheckResult out{parse(std::move(src)), {}, false, 0};
  EXPECT_FALSE(out.unit.diags.has_errors()) << "test source should parse cleanly";

  TypeChecker checker(definitions, &out.diags);
  out.ok = checker.check(*out.unit.program);
  out.error_count = checker.error_count();
  return out;
}

}  // namespace

// ============================================================================
// Functions
// ============================================================================

TEST(SemaTypeChecker, AcceptsWellFormedProgram)
{
  const auto r = check_source(
    "circuit Point { x: field, y: field }\n"
    "record Token { owner: address, balance: u64, amount: u64 }\n"
    "function mint(owner: address, p: Point) -> Token {\n"
    "  let total: u64 = 1u64;\n"
    "  return make(owner, total);\n"
    "}\n");
  EXPECT_TRUE(r.ok);
  EXPECT_TRUE(r.diags.empty());
}

TEST(SemaTypeChecker, DuplicateInputReportedPerRedeclarationAndReturnStillChecked)
{
  const auto r = check_source("function f(a: u8, a: u8, a: u8) -> u8 { }");
  EXPECT_FALSE(r.ok);

  EXPECT_EQ(r.diags.count_code(diag_code::k_duplicate_variable), 2U);
  EXPECT_EQ(r.diags.count_code(diag_code::k_function_has_no_return), 1U);
  EXPECT_EQ(r.error_count, 3U);

  const Diagnostic * dup = r.diags.find_code(diag_code::k_duplicate_variable);
  ASSERT_NE(dup, nullptr);
  EXPECT_EQ(dup->message, "duplicate variable `a`");
  ASSERT_EQ(dup->labels.size(), 2U);
  EXPECT_EQ(dup->labels[0].message, "redeclared here");
  EXPECT_EQ(dup->labels[1].message, "first declared here");
  EXPECT_EQ(r.unit.full_range(dup->labels[1].range).start_column, 12U);
}

TEST(SemaTypeChecker, EachRedeclarationOfOneNameIsAnError)
{
  const auto r = check_source("function f(a: u8, a: u8, a: u8) -> u8 { return a; }");
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error_count, 2U);
  ASSERT_EQ(r.diags.count_code(diag_code::k_duplicate_variable), 2U);

  // One per redeclaration, each pointing back at the first declaration.
  const auto & all = r.diags.all();
  EXPECT_EQ(r.unit.full_range(all[0].primary_range()).start_column, 19U);
  EXPECT_EQ(r.unit.full_range(all[1].primary_range()).start_column, 26U);
  for (const Diagnostic & d : all) {
    ASSERT_EQ(d.labels.size(), 2U);
    EXPECT_EQ(r.unit.full_range(d.labels[1].range).start_column, 12U);
  }
}

TEST(SemaTypeChecker, MissingReturnPointsAtFunctionName)
{
  const auto r = check_source("function compute(a: u8) -> u8 { let b = a; }");
  ASSERT_EQ(r.diags.size(), 1U);

  const Diagnostic & d = r.diags.all().front();
  EXPECT_EQ(d.code, diag_code::k_function_has_no_return);
  EXPECT_EQ(d.message, "function `compute` has no return");
  EXPECT_EQ(r.unit.slice(d.primary_range()), "compute");
  EXPECT_TRUE(d.help_message.has_value());
}

TEST(SemaTypeChecker, ReturnNestedInControlFlowCounts)
{
  const auto r = check_source(
    "function in_if(a: bool) -> u8 { if a { return 1u8; } }\n"
    "function in_else(a: bool) -> u8 { if a { } else if !a { } else { return 2u8; } }\n"
    "function in_loop() -> u8 { for i: u8 in 0u8..2u8 { return i; } }\n"
    "function in_block() -> u8 { { return 3u8; } }\n");
  EXPECT_TRUE(r.ok);
  EXPECT_TRUE(r.diags.empty());
}

TEST(SemaTypeChecker, FunctionWithoutOutputStillNeedsReturn)
{
  const auto r = check_source("function main() { }");
  EXPECT_EQ(r.diags.count_code(diag_code::k_function_has_no_return), 1U);
}

TEST(SemaTypeChecker, InputsAreScopedPerFunction)
{
  const auto r = check_source(
    "function f(a: u8) -> u8 { return a; }\n"
    "function g(a: u8) -> u8 { return a; }\n");
  EXPECT_TRUE(r.ok);
}

// ============================================================================
// Circuits and records
// ============================================================================

TEST(SemaTypeChecker, DuplicateCircuitMember)
{
  const auto r = check_source("circuit Point { x: field, y: field, x: field, y: field }");
  ASSERT_EQ(r.diags.size(), 1U);

  const Diagnostic & d = r.diags.all().front();
  EXPECT_EQ(d.code, diag_code::k_duplicate_circuit_member);
  EXPECT_EQ(d.message, "circuit `Point` has duplicate member `x`");
  EXPECT_EQ(r.unit.full_range(d.primary_range()).start_column, 37U);
}

TEST(SemaTypeChecker, DuplicateRecordVariable)
{
  const auto r =
    check_source("record Token { owner: address, balance: u64, owner: address }");
  ASSERT_EQ(r.diags.size(), 1U);
  EXPECT_EQ(r.diags.all().front().code, diag_code::k_duplicate_record_variable);
  EXPECT_EQ(
    r.diags.all().front().message, "record `Token` has duplicate record variable `owner`");
}

TEST(SemaTypeChecker, RecordMissingRequiredVariables)
{
  const auto r = check_source("record Empty { amount: u64 }");
  EXPECT_EQ(r.diags.count_code(diag_code::k_required_record_variable), 2U);

  const Diagnostic & owner = r.diags.all()[0];
  EXPECT_EQ(owner.message, "record `Empty` is missing required variable `owner: address`");
  EXPECT_EQ(r.unit.slice(owner.primary_range()), "Empty");
  ASSERT_TRUE(owner.help_message.has_value());
  EXPECT_EQ(*owner.help_message, "add `owner: address` to the record");

  EXPECT_EQ(
    r.diags.all()[1].message, "record `Empty` is missing required variable `balance: u64`");
}

TEST(SemaTypeChecker, RecordVariableWithWrongType)
{
  const auto r = check_source("record Token { owner: string, balance: u64 }");
  ASSERT_EQ(r.diags.size(), 1U);

  const Diagnostic & d = r.diags.all().front();
  EXPECT_EQ(d.code, diag_code::k_record_var_wrong_type);
  EXPECT_EQ(d.message, "record variable `owner` must have type `address`, found `string`");
  EXPECT_EQ(r.unit.slice(d.primary_range()), "string");
  ASSERT_EQ(d.fixits.size(), 1U);
  EXPECT_EQ(d.fixits[0].replacement_text, "address");
}

TEST(SemaTypeChecker, MissingAndWrongTypeAreExclusivePerField)
{
  const auto r = check_source("record Token { balance: u32 }");
  EXPECT_EQ(r.diags.count_code(diag_code::k_required_record_variable), 1U);
  EXPECT_EQ(r.diags.count_code(diag_code::k_record_var_wrong_type), 1U);
  EXPECT_EQ(r.diags.size(), 2U);
}

TEST(SemaTypeChecker, PlainCircuitHasNoRequiredVariables)
{
  const auto r = check_source("circuit Point { x: field }");
  EXPECT_TRUE(r.ok);
}

// ============================================================================
// Type names
// ============================================================================

TEST(SemaTypeChecker, UnknownTypeInSignatureAndBody)
{
  const auto r = check_source(
    "function f(a: Missing, b: [Gone; 2], c: (u8, Nope)) -> Absent {\n"
    "  let x: Local = a;\n"
    "  for i: Idx in 0u8..1u8 { }\n"
    "  return x;\n"
    "}\n");
  EXPECT_EQ(r.diags.count_code(diag_code::k_unknown_type), 6U);
  EXPECT_EQ(r.diags.all().front().message, "unknown type `Missing`");
}

TEST(SemaTypeChecker, TypeDeclaredLaterInProgramIsKnown)
{
  const auto r = check_source(
    "function f(p: Point) -> Point { return p; }\n"
    "circuit Point { x: field }\n");
  EXPECT_TRUE(r.ok);
}

TEST(SemaTypeChecker, ImportedCircuitIsKnownUnderQualifiedName)
{
  auto lib = parse("circuit Point { x: field }", "geometry.leo");
  ProgramContext definitions;
  definitions.store("main_Point", CircuitDefinition{lib.program->circuits[0]});

  const auto r = check_source("function f(p: Point) -> u8 { return 1u8; }", &definitions);
  EXPECT_TRUE(r.ok);
  EXPECT_TRUE(r.diags.empty());

  // Without the store the same name is unknown.
  const auto unresolved = check_source("function f(p: Point) -> u8 { return 1u8; }");
  EXPECT_EQ(unresolved.diags.count_code(diag_code::k_unknown_type), 1U);
}

TEST(SemaTypeChecker, ImportedFunctionDoesNotMakeATypeKnown)
{
  auto lib = parse("function Point() -> u8 { return 1u8; }", "geometry.leo");
  ProgramContext definitions;
  definitions.store("main_Point", FunctionDefinition{lib.program->functions[0], std::nullopt});

  const auto r = check_source("function f(p: Point) -> u8 { return 1u8; }", &definitions);
  EXPECT_EQ(r.diags.count_code(diag_code::k_unknown_type), 1U);
}

TEST(SemaTypeChecker, ShadowedDeclarationsAreReported)
{
  const auto r = check_source(
    "function f() -> u8 { return 1u8; }\n"
    "function f() -> u8 { return 2u8; }\n");
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.diags.count_code(diag_code::k_shadowed_function), 1U);
}

TEST(SemaTypeChecker, VisitFunctionDirectly)
{
  auto unit = parse("function f(a: u8) -> u8 { return a; }");
  DiagnosticBag diags;
  TypeChecker checker(nullptr, &diags);

  checker.visit_function(*unit.program->functions[0]);
  EXPECT_FALSE(checker.has_errors());
  EXPECT_EQ(checker.current_function(), "f");
  ASSERT_NE(checker.symbol_table().lookup_variable("a"), nullptr);
  EXPECT_EQ(checker.symbol_table().lookup_variable("a")->declaration.kind, DeclarationKind::Input);
}

TEST(SemaTypeChecker, SilentModeCountsErrors)
{
  auto unit = parse("record R { x: u8 }\nfunction f() { }");
  TypeChecker checker;
  EXPECT_FALSE(checker.check(*unit.program));
  EXPECT_EQ(checker.error_count(), 3U);
}

// ============================================================================
// Reuse
// ============================================================================

TEST(SemaTypeChecker, CheckingTheSameProgramTwiceGivesTheSameResult)
{
  auto unit = parse("circuit Point { x: u8 }\nfunction main(a: Point) -> u8 { return a.x; }\n");
  ASSERT_FALSE(unit.diags.has_errors());

  DiagnosticBag diags;
  TypeChecker checker(nullptr, &diags);
  EXPECT_TRUE(checker.check(*unit.program));
  EXPECT_TRUE(checker.check(*unit.program));
  EXPECT_EQ(checker.error_count(), 0U);
  EXPECT_TRUE(diags.empty());
}

TEST(SemaTypeChecker, DeclarationsDoNotLeakIntoTheNextProgram)
{
  auto first = parse("circuit Point { x: u8 }\n", "a.leo");
  auto second = parse("function g(p: Point) -> u8 { return 1u8; }\n", "b.leo");
  ASSERT_FALSE(first.diags.has_errors());
  ASSERT_FALSE(second.diags.has_errors());

  DiagnosticBag diags;
  TypeChecker checker(nullptr, &diags);
  EXPECT_TRUE(checker.check(*first.program));
  EXPECT_FALSE(checker.check(*second.program));
  EXPECT_EQ(checker.error_count(), 1U);
  EXPECT_EQ(diags.count_code(diag_code::k_unknown_type), 1U);
}
