// tests/unit/imports/test_import_resolver.cpp - Unit tests for ImportResolver
//

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "circ_dsl/imports/import_resolver.hpp"
#include "circ_dsl/imports/program_context.hpp"
#include "circ_dsl/imports/qualified_name.hpp"
#include "circ_dsl/test_support/parse_helpers.hpp"
#include "circ_dsl/test_support/temp_tree.hpp"

using namespace circ_dsl;
using circ_dsl::test_support::parse;
using circ_dsl::test_support::TempDir;

namespace fs = std::filesystem;

namespace
{

// Parses `main_src` as `main.leo` and resolves its imports under `root`.
struct Resolution
{
  test_support::TestParseUnit unit;
  ProgramContext context;
  ImportStatus status;
};

void resolve(Resolution & r, const TempDir & root, std::string main_src)
{
  r.unit = parse(std::move(main_src));
  ASSERT_FALSE(r.unit.diags.has_errors());

  ImportResolver resolver(r.context);
  resolver.set_search_root(root.path());
  r.status = resolver.resolve_definitions(*r.unit.program);
}

}  // namespace

TEST(ImportsQualifiedName, JoinScope)
{
  EXPECT_EQ(join_scope("main", "Point"), "main_Point");
  EXPECT_EQ(join_scope("a_b", "c"), "a_b_c");
}

// ============================================================================
// Successful resolution
// ============================================================================

TEST(ImportsResolver, StarImportsEveryDefinition)
{
  TempDir root("star");
  root.write(
    "src/geometry.leo",
    "circuit Point { x: field, y: field }\n"
    "function origin() -> Point { return make(); }\n");

  Resolution r;
  resolve(r, root, "import geometry.*;\nfunction main() -> u8 { return 1u8; }\n");

  ASSERT_TRUE(r.status.success) << r.status.error->message;
  EXPECT_NE(r.context.lookup_circuit("main_Point"), nullptr);
  EXPECT_NE(r.context.lookup_function("main_origin"), nullptr);
  EXPECT_NE(r.context.lookup_function("main_main"), nullptr);
  EXPECT_FALSE(r.context.contains("geometry_Point"));
  EXPECT_EQ(r.context.size(), 3U);
}

TEST(ImportsResolver, SymbolImportUsesAlias)
{
  TempDir root("alias");
  root.write("src/foo.leo", "function bar() -> u8 { return 1u8; }\n");

  Resolution r;
  resolve(r, root, "import foo.bar as baz;\n");

  ASSERT_TRUE(r.status.success);
  EXPECT_NE(r.context.lookup_function("main_baz"), nullptr);
  EXPECT_FALSE(r.context.contains("main_bar"));

  const auto * def = std::get_if<FunctionDefinition>(r.context.lookup("main_baz"));
  ASSERT_NE(def, nullptr);
  EXPECT_EQ(def->decl->name, "bar");
  EXPECT_FALSE(def->call_context.has_value());
}

TEST(ImportsResolver, SymbolImportWithoutAlias)
{
  TempDir root("symbol");
  root.write("src/foo.leo", "function bar() -> u8 { return 1u8; }\nfunction other() { }\n");

  Resolution r;
  resolve(r, root, "import foo.bar;\n");

  ASSERT_TRUE(r.status.success);
  EXPECT_NE(r.context.lookup_function("main_bar"), nullptr);
  EXPECT_FALSE(r.context.contains("main_other"));
  EXPECT_EQ(r.context.size(), 1U);
}

TEST(ImportsResolver, SymbolPrefersCircuitOverFunction)
{
  TempDir root("prefer");
  root.write("src/foo.leo", "function Thing() { }\ncircuit Thing { x: u8 }\n");

  Resolution r;
  resolve(r, root, "import foo.Thing;\n");

  ASSERT_TRUE(r.status.success);
  EXPECT_NE(r.context.lookup_circuit("main_Thing"), nullptr);
  EXPECT_EQ(r.context.lookup_function("main_Thing"), nullptr);
}

TEST(ImportsResolver, SubPackage)
{
  TempDir root("subpkg");
  root.write("src/foo/src/sub.leo", "circuit Inner { x: u8 }\n");

  Resolution r;
  resolve(r, root, "import foo.sub.Inner;\n");

  ASSERT_TRUE(r.status.success) << r.status.error->message;
  EXPECT_NE(r.context.lookup_circuit("main_Inner"), nullptr);
}

TEST(ImportsResolver, MultipleAccesses)
{
  TempDir root("multiple");
  root.write("src/bar.leo", "circuit B { x: u8 }\n");

  Resolution r;
  resolve(r, root, "import bar.(B as Renamed, B);\n");

  ASSERT_TRUE(r.status.success);
  EXPECT_NE(r.context.lookup_circuit("main_Renamed"), nullptr);
  EXPECT_NE(r.context.lookup_circuit("main_B"), nullptr);
}

TEST(ImportsResolver, DashedPackageName)
{
  TempDir root("dashed");
  root.write("src/hello-world.leo", "function hi() { }\n");

  Resolution r;
  resolve(r, root, "import hello-world.*;\n");

  ASSERT_TRUE(r.status.success);
  EXPECT_NE(r.context.lookup_function("main_hi"), nullptr);
}

TEST(ImportsResolver, NestedImportsResolveIntoImportingScope)
{
  TempDir root("nested");
  root.write("src/foo.leo", "import bar.*;\nfunction f() -> u8 { return 1u8; }\n");
  root.write("src/bar.leo", "circuit Deep { x: u8 }\n");

  Resolution r;
  resolve(r, root, "import foo.f;\n");

  ASSERT_TRUE(r.status.success);
  EXPECT_NE(r.context.lookup_function("main_f"), nullptr);
  EXPECT_NE(r.context.lookup_circuit("main_Deep"), nullptr);
}

TEST(ImportsResolver, DiamondImportIsNotACycle)
{
  TempDir root("diamond");
  root.write("src/left.leo", "import base.*;\nfunction l() { }\n");
  root.write("src/right.leo", "import base.*;\nfunction r() { }\n");
  root.write("src/base.leo", "circuit Base { x: u8 }\n");

  Resolution r;
  resolve(r, root, "import left.*;\nimport right.*;\n");

  ASSERT_TRUE(r.status.success) << r.status.error->message;
  EXPECT_NE(r.context.lookup_circuit("main_Base"), nullptr);
  EXPECT_NE(r.context.lookup_function("main_l"), nullptr);
  EXPECT_NE(r.context.lookup_function("main_r"), nullptr);
}

TEST(ImportsResolver, EnforceImportWithExplicitScope)
{
  TempDir root("scope");
  root.write("src/foo.leo", "circuit C { x: u8 }\n");
  auto unit = parse("import foo.C;\n");

  ProgramContext context;
  ImportResolver resolver(context);
  resolver.set_search_root(root.path());
  EXPECT_EQ(resolver.search_root().string(), root.path().string());

  const ImportStatus st = resolver.enforce_import("custom", *unit.program->imports[0]);
  ASSERT_TRUE(st.success);
  EXPECT_NE(context.lookup_circuit("custom_C"), nullptr);
}

// ============================================================================
// Failures
// ============================================================================

TEST(ImportsResolver, UnknownSymbol)
{
  TempDir root("unknown_symbol");
  root.write("src/foo.leo", "function bar() { }\n");

  Resolution r;
  resolve(r, root, "import foo.nope;\n");

  ASSERT_FALSE(r.status.success);
  ASSERT_TRUE(r.status.error.has_value());
  EXPECT_EQ(r.status.error->kind, ImportErrorKind::UnknownSymbol);
  EXPECT_EQ(r.status.error->message, "cannot find imported symbol `nope` in package `main`");
  EXPECT_EQ(r.status.error->path.filename().string(), "foo.leo");
  EXPECT_EQ(r.unit.slice(r.status.error->range), "nope");
}

TEST(ImportsResolver, UnknownPackage)
{
  TempDir root("unknown_package");
  root.write("src/foo.leo", "function bar() { }\n");

  Resolution r;
  resolve(r, root, "import missing.*;\n");

  ASSERT_FALSE(r.status.success);
  EXPECT_EQ(r.status.error->kind, ImportErrorKind::UnknownPackage);
  EXPECT_EQ(r.status.error->message, "cannot find imported package `missing`");
  EXPECT_EQ(r.unit.slice(r.status.error->range), "missing");
  EXPECT_TRUE(r.status.error->path.empty());
}

TEST(ImportsResolver, MissingSourceDirectory)
{
  TempDir root("no_src");

  Resolution r;
  resolve(r, root, "import foo.*;\n");

  ASSERT_FALSE(r.status.success);
  EXPECT_EQ(r.status.error->kind, ImportErrorKind::DirectoryError);
  EXPECT_EQ(r.unit.slice(r.status.error->range), "foo");
  EXPECT_EQ(r.status.error->path.filename().string(), "src");
}

TEST(ImportsResolver, PackageDirectoryCannotBeImportedDirectly)
{
  TempDir root("expected_file");
  root.mkdir("src/foo");

  Resolution r;
  resolve(r, root, "import foo.*;\n");

  ASSERT_FALSE(r.status.success);
  EXPECT_EQ(r.status.error->kind, ImportErrorKind::ExpectedFile);
}

TEST(ImportsResolver, ImportedSyntaxError)
{
  TempDir root("parse_error");
  root.write("src/foo.leo", "circuit { }\n");

  Resolution r;
  resolve(r, root, "import foo.*;\n");

  ASSERT_FALSE(r.status.success);
  EXPECT_EQ(r.status.error->kind, ImportErrorKind::ParseError);
  EXPECT_EQ(r.unit.slice(r.status.error->range), "*");
}

TEST(ImportsResolver, MultipleIsFailFast)
{
  TempDir root("fail_fast");
  root.write("src/foo.leo", "function a() { }\nfunction c() { }\n");

  Resolution r;
  resolve(r, root, "import foo.(a, nope, c);\nfunction main() { }\n");

  ASSERT_FALSE(r.status.success);
  EXPECT_EQ(r.status.error->kind, ImportErrorKind::UnknownSymbol);

  // Definitions stored before the failure stay; later ones are never reached.
  EXPECT_TRUE(r.context.contains("main_a"));
  EXPECT_FALSE(r.context.contains("main_c"));
  EXPECT_FALSE(r.context.contains("main_main"));
}

TEST(ImportsResolver, CyclicImport)
{
  TempDir root("cycle");
  root.write("src/a.leo", "import b.*;\nfunction fa() { }\n");
  root.write("src/b.leo", "import a.*;\nfunction fb() { }\n");

  Resolution r;
  resolve(r, root, "import a.*;\n");

  ASSERT_FALSE(r.status.success);
  EXPECT_EQ(r.status.error->kind, ImportErrorKind::CyclicImport);
  EXPECT_EQ(r.status.error->path.filename().string(), "a.leo");
  EXPECT_EQ(diagnostic_code(r.status.error->kind), "E0207");
}

TEST(ImportsResolver, SymbolImportCycleThroughNestedImports)
{
  TempDir root("symbol_cycle");
  root.write("src/a.leo", "import b.fb;\nfunction fa() { }\n");
  root.write("src/b.leo", "import a.fa;\nfunction fb() { }\n");

  Resolution r;
  resolve(r, root, "import a.fa;\n");

  ASSERT_FALSE(r.status.success);
  EXPECT_EQ(r.status.error->kind, ImportErrorKind::CyclicImport);
}

TEST(ImportsResolver, ImportingTheEntryFileIsACycle)
{
  TempDir root("self");
  const fs::path main_file = root.write("src/main.leo", "import main.*;\nfunction m() { }\n");

  auto unit = parse("import main.*;\nfunction m() { }\n", main_file);
  ASSERT_FALSE(unit.diags.has_errors());

  ProgramContext context;
  ImportResolver resolver(context);
  resolver.set_search_root(root.path());
  resolver.set_entry_file(main_file);

  const ImportStatus st = resolver.resolve_definitions(*unit.program);
  ASSERT_FALSE(st.success);
  EXPECT_EQ(st.error->kind, ImportErrorKind::CyclicImport);
}
