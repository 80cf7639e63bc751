// tests/integration/test_compiler_driver.cpp - Compiler driver integration tests
//
// End-to-end runs of the checking pipeline: parse, resolve imports, type check.

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>

#include "circ_dsl/basic/diagnostic_codes.hpp"
#include "circ_dsl/basic/diagnostic_printer.hpp"
#include "circ_dsl/driver/compiler.hpp"
#include "circ_dsl/project/project_config.hpp"
#include "circ_dsl/test_support/temp_tree.hpp"

using namespace circ_dsl;
using circ_dsl::test_support::TempDir;

namespace fs = std::filesystem;

namespace
{

CompileOptions rooted_at(const TempDir & root)
{
  CompileOptions options;
  options.search_root = root.path();
  return options;
}

}  // namespace

TEST(IntegrationCompilerDriver, CleanSourceChecks)
{
  const CompileResult result = Compiler::check_source(
    "token.leo",
    "record Token { owner: address, balance: u64 }\n"
    "function mint(owner: address, amount: u64) -> Token { return make(owner, amount); }\n",
    CompileOptions{});

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  ASSERT_EQ(result.programs.size(), 1U);
  EXPECT_EQ(result.programs[0]->name, "token");
  EXPECT_TRUE(result.context->contains("token_Token"));
  EXPECT_TRUE(result.context->contains("token_mint"));
}

TEST(IntegrationCompilerDriver, TypeErrorsAreCollected)
{
  const CompileResult result = Compiler::check_source(
    "main.leo",
    "record Token { owner: string }\n"
    "function f(a: u8, a: u8) -> u8 { }\n",
    CompileOptions{});

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.diagnostics.count_code(diag_code::k_record_var_wrong_type), 1U);
  EXPECT_EQ(result.diagnostics.count_code(diag_code::k_required_record_variable), 1U);
  EXPECT_EQ(result.diagnostics.count_code(diag_code::k_duplicate_variable), 1U);
  EXPECT_EQ(result.diagnostics.count_code(diag_code::k_function_has_no_return), 1U);
}

TEST(IntegrationCompilerDriver, SyntaxErrorStopsBeforeTypeChecking)
{
  const CompileResult result =
    Compiler::check_source("main.leo", "function f( -> u8 { }\n", CompileOptions{});

  EXPECT_FALSE(result.success);
  EXPECT_GE(result.diagnostics.count_code(diag_code::k_syntax_error), 1U);
  EXPECT_EQ(result.diagnostics.count_code(diag_code::k_function_has_no_return), 0U);
  EXPECT_TRUE(result.programs.empty());
}

TEST(IntegrationCompilerDriver, FileWithImports)
{
  TempDir root("driver_imports");
  root.write("src/geometry.leo", "circuit Point { x: field, y: field }\n");
  const fs::path main_file = root.write(
    "src/main.leo",
    "import geometry.*;\n"
    "function norm(p: Point) -> field { return p.x; }\n");

  const CompileResult result = Compiler::check_file(main_file, rooted_at(root));

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_NE(result.context->lookup_circuit("main_Point"), nullptr);
  EXPECT_NE(result.context->lookup_function("main_norm"), nullptr);
}

TEST(IntegrationCompilerDriver, ImportFailureBecomesDiagnosticAndCheckingContinues)
{
  TempDir root("driver_import_error");
  root.write("src/foo.leo", "function bar() -> u8 { return 1u8; }\n");
  const fs::path main_file = root.write(
    "src/main.leo",
    "import foo.nope;\n"
    "function f() -> u8 { }\n");

  const CompileResult result = Compiler::check_file(main_file, rooted_at(root));

  EXPECT_FALSE(result.success);
  const Diagnostic * import_error = result.diagnostics.find_code(diag_code::k_unknown_symbol);
  ASSERT_NE(import_error, nullptr);
  EXPECT_EQ(import_error->message, "cannot find imported symbol `nope` in package `main`");
  ASSERT_TRUE(import_error->help_message.has_value());
  EXPECT_NE(import_error->help_message->find("foo.leo"), std::string::npos);

  // Type checking still ran on the entry program.
  EXPECT_EQ(result.diagnostics.count_code(diag_code::k_function_has_no_return), 1U);
}

TEST(IntegrationCompilerDriver, UnknownPackageIsReportedAtPackageName)
{
  TempDir root("driver_unknown_package");
  root.mkdir("src");
  const fs::path main_file = root.write("main.leo", "import missing.*;\n");

  const CompileResult result = Compiler::check_file(main_file, rooted_at(root));

  ASSERT_FALSE(result.success);
  const Diagnostic * d = result.diagnostics.find_code(diag_code::k_unknown_package);
  ASSERT_NE(d, nullptr);
  EXPECT_FALSE(d->help_message.has_value());
  EXPECT_EQ(result.context->sources().get_slice(d->primary_range()), "missing");
}

TEST(IntegrationCompilerDriver, SelfImportIsCyclic)
{
  TempDir root("driver_self_import");
  const fs::path main_file = root.write("src/main.leo", "import main.*;\n");

  const CompileResult result = Compiler::check_file(main_file, rooted_at(root));
  EXPECT_EQ(result.diagnostics.count_code(diag_code::k_cyclic_import), 1U);
}

TEST(IntegrationCompilerDriver, ImportedDeclarationsAreNotTypeChecked)
{
  TempDir root("driver_imported_record");
  root.write("src/coins.leo", "record Coin { owner: address }\n");
  const fs::path main_file = root.write(
    "src/main.leo",
    "import coins.Coin;\n"
    "function mint(c: Coin) -> Coin { return c; }\n");

  const CompileResult result = Compiler::check_file(main_file, rooted_at(root));

  EXPECT_TRUE(result.success);
  EXPECT_NE(result.context->lookup_circuit("main_Coin"), nullptr);
}

TEST(IntegrationCompilerDriver, MissingFileIsReported)
{
  TempDir root("driver_missing");
  const CompileResult result = Compiler::check_file(root.path() / "nope.leo", CompileOptions{});

  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_EQ(result.diagnostics.all().front().code, diag_code::k_io_error);
}

TEST(IntegrationCompilerDriver, ProjectEntryPointsShareOneStore)
{
  TempDir root("driver_project");
  root.write(
    "circ.yaml",
    "package:\n"
    "  name: 'demo'\n"
    "compiler:\n"
    "  entry_points:\n"
    "    - 'src/main.leo'\n"
    "    - 'src/tool.leo'\n");
  root.write("src/shapes.leo", "circuit Square { side: u32 }\n");
  root.write("src/main.leo", "import shapes.*;\nfunction main(s: Square) -> u32 { return s.side; }\n");
  root.write("src/tool.leo", "function helper() -> u8 { return 0u8; }\n");

  const ConfigLoadResult config = load_project_config(root.path() / "circ.yaml");
  ASSERT_TRUE(config.success) << config.error;

  const CompileResult result = Compiler::check_project(config.config, CompileOptions{});

  EXPECT_TRUE(result.success);
  ASSERT_EQ(result.programs.size(), 2U);
  EXPECT_EQ(result.programs[0]->name, "main");
  EXPECT_EQ(result.programs[1]->name, "tool");
  EXPECT_TRUE(result.context->contains("main_Square"));
  EXPECT_TRUE(result.context->contains("main_main"));
  EXPECT_TRUE(result.context->contains("tool_helper"));
}

TEST(IntegrationCompilerDriver, RepeatedEntryPointIsCheckedOnceWithWarning)
{
  TempDir root("driver_repeat");
  root.write(
    "circ.yaml",
    "package:\n"
    "  name: 'demo'\n"
    "compiler:\n"
    "  entry_points:\n"
    "    - 'src/main.leo'\n"
    "    - './src/main.leo'\n");
  root.write("src/main.leo", "function main() -> u8 { return 0u8; }\n");

  const ConfigLoadResult config = load_project_config(root.path() / "circ.yaml");
  ASSERT_TRUE(config.success) << config.error;

  const CompileResult result = Compiler::check_project(config.config, CompileOptions{});
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.programs.size(), 1U);
  EXPECT_EQ(result.diagnostics.warnings().size(), 1U);
  EXPECT_EQ(result.diagnostics.count_code(diag_code::k_duplicate_entry_point), 1U);

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(result.diagnostics, result.context->sources());

  const std::string text = out.str();
  EXPECT_NE(text.find("warning[W0001]: entry point"), std::string::npos);
  EXPECT_NE(text.find("is listed more than once"), std::string::npos);
  EXPECT_NE(text.find("0 errors, 1 warning emitted"), std::string::npos);
}

TEST(IntegrationCompilerDriver, ProjectWithoutEntryPoints)
{
  ProjectConfig config;
  config.package.name = "empty";

  const CompileResult result = Compiler::check_project(config, CompileOptions{});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.diagnostics.count_code(diag_code::k_io_error), 1U);
}

TEST(IntegrationCompilerDriver, DiagnosticsRenderAgainstTheirSourceFile)
{
  TempDir root("driver_render");
  root.write("src/foo.leo", "function bar() -> u8 { return 1u8; }\n");
  const fs::path main_file = root.write("src/main.leo", "import foo.nope;\n");

  const CompileResult result = Compiler::check_file(main_file, rooted_at(root));
  ASSERT_FALSE(result.success);

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(result.diagnostics, result.context->sources());

  const std::string text = out.str();
  EXPECT_NE(text.find("error[E0204]"), std::string::npos);
  EXPECT_NE(text.find("main.leo:1:12"), std::string::npos);
  EXPECT_NE(text.find("import foo.nope;"), std::string::npos);
  EXPECT_NE(text.find("= help: while resolving"), std::string::npos);
}
