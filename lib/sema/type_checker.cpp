// circ_dsl/sema/type_checker.cpp - Declaration-level type checking
//
#include "circ_dsl/sema/type_checker.hpp"

#include <string>
#include <unordered_set>
#include <utility>

#include "circ_dsl/basic/casting.hpp"
#include "circ_dsl/basic/diagnostic_codes.hpp"
#include "circ_dsl/imports/qualified_name.hpp"
#include "circ_dsl/sema/symbol_table_builder.hpp"
#include "circ_dsl/sema/type_utils.hpp"

namespace circ_dsl
{

TypeChecker::TypeChecker(const ProgramContext * definitions, DiagnosticBag * diags)
: definitions_(definitions), diags_(diags)
{
}

// ============================================================================
// Entry Points
// ============================================================================

bool TypeChecker::check(const Program & program)
{
  has_errors_ = false;
  error_count_ = 0;
  program_ = &program;
  table_.clear();

  SymbolTableBuilder builder(table_, diags_);
  if (!builder.build(program)) {
    has_errors_ = true;
    error_count_ += builder.error_count();
  }

  for (const CircuitDecl * circuit : program.circuits) {
    visit_circuit(*circuit);
  }
  for (const FunctionDecl * function : program.functions) {
    visit_function(*function);
  }

  parent_ = {};
  return !has_errors_;
}

void TypeChecker::visit_function(const FunctionDecl & function)
{
  has_return_ = false;
  table_.clear_variables();
  parent_ = function.name;

  for (const FunctionInput * input : function.inputs) {
    check_ident_type(input->type);

    const VariableSymbol symbol{input->type, input->name_range, Declaration::input(input->mode)};
    if (!table_.insert_variable(input->name, symbol)) {
      count_error();
      if (diags_ != nullptr) {
        const VariableSymbol * first = table_.lookup_variable(input->name);
        diags_
          ->report_error(
            input->name_range, "duplicate variable `" + std::string(input->name) + "`",
            "redeclared here")
          .with_code(diag_code::k_duplicate_variable)
          .with_secondary_label(first->span, "first declared here");
      }
    }
  }

  check_ident_type(function.output);
  visit_block(function.body);

  if (!has_return_) {
    count_error();
    if (diags_ != nullptr) {
      diags_
        ->report_error(
          function.name_range, "function `" + std::string(function.name) + "` has no return",
          "no `return` in this function")
        .with_code(diag_code::k_function_has_no_return)
        .with_help("add a `return` statement to the function body");
    }
  }
}

void TypeChecker::visit_circuit(const CircuitDecl & circuit)
{
  // Only the first collision is reported.
  std::unordered_set<std::string_view> names;
  for (const CircuitMember * member : circuit.members) {
    if (names.insert(member->name).second) continue;

    if (circuit.is_record) {
      report_error(
        member->get_range(),
        "record `" + std::string(circuit.name) + "` has duplicate record variable `" +
          std::string(member->name) + "`",
        diag_code::k_duplicate_record_variable);
    } else {
      report_error(
        member->get_range(),
        "circuit `" + std::string(circuit.name) + "` has duplicate member `" +
          std::string(member->name) + "`",
        diag_code::k_duplicate_circuit_member);
    }
    break;
  }

  if (circuit.is_record) {
    check_has_field(circuit, k_record_owner);
    check_has_field(circuit, k_record_balance);
  }
}

void TypeChecker::check_ident_type(const TypeNode * type)
{
  if (type == nullptr) {
    return;
  }

  if (const auto * named = dyn_cast<NamedType>(type)) {
    if (!is_known_circuit(named->name)) {
      report_error(
        named->get_range(), "unknown type `" + std::string(named->name) + "`",
        diag_code::k_unknown_type);
    }
    return;
  }
  if (const auto * array = dyn_cast<ArrayType>(type)) {
    check_ident_type(array->element);
    return;
  }
  if (const auto * tuple = dyn_cast<TupleType>(type)) {
    for (const TypeNode * element : tuple->elements) {
      check_ident_type(element);
    }
  }
  // Primitive types are always valid; a MissingType was already reported by the parser.
}

// ============================================================================
// Statements
// ============================================================================

void TypeChecker::visit_block(const BlockStmt * block)
{
  if (block == nullptr) return;
  for (const Stmt * stmt : block->statements) {
    visit_stmt(stmt);
  }
}

void TypeChecker::visit_stmt(const Stmt * stmt)
{
  if (stmt == nullptr) return;

  switch (stmt->get_kind()) {
    case NodeKind::BlockStmt:
      visit_block(cast<BlockStmt>(stmt));
      break;
    case NodeKind::ReturnStmt:
      has_return_ = true;
      break;
    case NodeKind::DefinitionStmt:
      check_ident_type(cast<DefinitionStmt>(stmt)->type);
      break;
    case NodeKind::ConditionalStmt: {
      const auto * cond = cast<ConditionalStmt>(stmt);
      visit_block(cond->then_block);
      visit_stmt(cond->otherwise);
      break;
    }
    case NodeKind::IterationStmt: {
      const auto * loop = cast<IterationStmt>(stmt);
      check_ident_type(loop->type);
      visit_block(loop->body);
      break;
    }
    default:
      break;
  }
}

// ============================================================================
// Helpers
// ============================================================================

void TypeChecker::check_has_field(
  const CircuitDecl & circuit, const RequiredRecordVariable & required)
{
  const std::string expected_name = std::string(to_string(required.type));
  const std::string field = std::string(required.name) + ": " + expected_name;

  const CircuitMember * member = circuit.find_member(required.name);
  if (member == nullptr) {
    count_error();
    if (diags_ != nullptr) {
      diags_
        ->report_error(
          circuit.name_range,
          "record `" + std::string(circuit.name) + "` is missing required variable `" + field +
            "`")
        .with_code(diag_code::k_required_record_variable)
        .with_help("add `" + field + "` to the record");
    }
    return;
  }

  const PrimitiveType expected(required.type);
  if (!types_equal_flat(member->type, &expected)) {
    count_error();
    if (diags_ != nullptr) {
      diags_
        ->report_error(
          member->type->get_range(),
          "record variable `" + std::string(required.name) + "` must have type `" +
            expected_name + "`, found `" + type_to_string(member->type) + "`")
        .with_code(diag_code::k_record_var_wrong_type)
        .with_fixit(member->type->get_range(), expected_name);
    }
  }
}

bool TypeChecker::is_known_circuit(std::string_view name) const
{
  if (table_.lookup_circuit(name) != nullptr) {
    return true;
  }
  if (definitions_ != nullptr && program_ != nullptr) {
    return definitions_->lookup_circuit(join_scope(program_->name, name)) != nullptr;
  }
  return false;
}

void TypeChecker::count_error() noexcept
{
  has_errors_ = true;
  ++error_count_;
}

void TypeChecker::report_error(SourceRange range, std::string message, std::string_view code)
{
  count_error();

  if (diags_ != nullptr) {
    diags_->report_error(range, std::move(message)).with_code(code);
  }
}

}  // namespace circ_dsl
