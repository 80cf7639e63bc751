// circc - circ_dsl checker command line interface
//
// Usage:
//   circc check [file.leo | --project] [--root <dir>]
//   circc dump-ast <file.leo>
//   circc symbols [file.leo | --project] [--root <dir>]
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <fmt/core.h>

#include "circ_dsl/ast/ast_context.hpp"
#include "circ_dsl/ast/json_visitor.hpp"
#include "circ_dsl/basic/diagnostic_printer.hpp"
#include "circ_dsl/driver/compiler.hpp"
#include "circ_dsl/project/project_config.hpp"
#include "circ_dsl/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

void print_usage(const char * program_name)
{
  std::cerr << "circ_dsl checker v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [file.leo]         Parse, resolve imports and type check\n"
            << "  dump-ast <file.leo>      Print the AST of a file as JSON\n"
            << "  symbols [file.leo]       Print the resolved definition store as JSON\n\n"
            << "Options:\n"
            << "  --project                Check entry points from circ.yaml\n"
            << "  --root <dir>             Package search root (default: config or cwd)\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const circ_dsl::DiagnosticBag & diagnostics, const circ_dsl::SourceRegistry & sources)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  circ_dsl::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, sources);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string search_root;
  bool use_project = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--root") {
      if (i + 1 < argc) {
        args.search_root = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

/// Runs the checking pipeline on a file or on the project. Returns false on setup errors.
bool run_check(const CommandArgs & args, circ_dsl::CompileResult & result)
{
  circ_dsl::CompileOptions options;
  options.verbose = args.verbose;
  if (!args.search_root.empty()) {
    options.search_root = fs::absolute(args.search_root);
  }

  if (args.use_project || args.input_file.empty()) {
    auto config_path = circ_dsl::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << circ_dsl::k_project_config_file_name
                << " found in current directory or parents\n";
      return false;
    }

    const auto config_result = circ_dsl::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return false;
    }

    if (args.verbose) {
      fmt::print(stderr, "Checking project: {}\n", config_result.config.package.name);
    }
    result = circ_dsl::Compiler::check_project(config_result.config, options);
    return true;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return false;
  }

  if (args.verbose) {
    fmt::print(stderr, "Checking: {}\n", input_path.string());
  }
  result = circ_dsl::Compiler::check_file(input_path, options);
  return true;
}

int cmd_check(const CommandArgs & args)
{
  circ_dsl::CompileResult result;
  if (!run_check(args, result)) {
    return 1;
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, result.context->sources());
  }

  if (result.success) {
    std::cout << (args.input_file.empty() ? "project" : args.input_file) << ": OK\n";
    return 0;
  }
  return 1;
}

int cmd_symbols(const CommandArgs & args)
{
  circ_dsl::CompileResult result;
  if (!run_check(args, result)) {
    return 1;
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, result.context->sources());
  }

  std::cout << circ_dsl::to_json(*result.context).dump(2) << "\n";
  return result.success ? 0 : 1;
}

int cmd_dump_ast(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: circc dump-ast <file.leo>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  std::ifstream file(input_path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return 1;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  circ_dsl::SourceRegistry sources;
  circ_dsl::AstContext ast;
  circ_dsl::DiagnosticBag diags;
  const circ_dsl::ParseOutput parsed =
    circ_dsl::parse_source(sources, input_path, buffer.str(), ast, diags);

  if (!diags.empty()) {
    print_diagnostics(diags, sources);
  }

  std::cout << circ_dsl::to_json(parsed.program).dump(2) << "\n";
  return diags.has_errors() ? 1 : 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }
  if (args.command == "symbols") {
    return cmd_symbols(args);
  }
  if (args.command == "dump-ast") {
    return cmd_dump_ast(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n\n";
  print_usage(argv[0]);
  return 1;
}
