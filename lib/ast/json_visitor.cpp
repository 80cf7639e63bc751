// circ_dsl/ast/json_visitor.cpp - JSON serialization implementation
//
#include "circ_dsl/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <variant>

#include "circ_dsl/ast/ast_enums.hpp"
#include "circ_dsl/basic/casting.hpp"
#include "circ_dsl/imports/program_context.hpp"

namespace circ_dsl
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (!r.is_valid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().offset()}, {"end", r.get_end().offset()}};
}

json j_type(const TypeNode * t);
json j_expr(const Expr * e);
json j_stmt(const Stmt * s);
json j_package(const Package * p);

// ============================================================================
// Types
// ============================================================================

json j_type(const TypeNode * t)
{
  if (t == nullptr) return nullptr;

  if (const auto * pt = dyn_cast<PrimitiveType>(t)) {
    return json{
      {"type", "PrimitiveType"},
      {"range", j_range(pt->get_range())},
      {"name", std::string(to_string(pt->primitive))}};
  }
  if (const auto * nt = dyn_cast<NamedType>(t)) {
    return json{
      {"type", "NamedType"}, {"range", j_range(nt->get_range())}, {"name", std::string(nt->name)}};
  }
  if (const auto * at = dyn_cast<ArrayType>(t)) {
    json dims = json::array();
    for (const uint64_t d : at->dimensions) dims.push_back(d);
    return json{
      {"type", "ArrayType"},
      {"range", j_range(at->get_range())},
      {"element", j_type(at->element)},
      {"dimensions", dims}};
  }
  if (const auto * tt = dyn_cast<TupleType>(t)) {
    json elements = json::array();
    for (const TypeNode * e : tt->elements) elements.push_back(j_type(e));
    return json{
      {"type", "TupleType"}, {"range", j_range(tt->get_range())}, {"elements", elements}};
  }
  return json{{"type", "MissingType"}, {"range", j_range(t->get_range())}};
}

// ============================================================================
// Expressions
// ============================================================================

json j_expr(const Expr * e)
{
  if (e == nullptr) return nullptr;

  switch (e->get_kind()) {
    case NodeKind::IntLiteral:
      return json{
        {"type", "IntLiteral"},
        {"range", j_range(e->get_range())},
        {"value", std::string(cast<IntLiteralExpr>(e)->text)}};
    case NodeKind::BoolLiteral:
      return json{
        {"type", "BoolLiteral"},
        {"range", j_range(e->get_range())},
        {"value", cast<BoolLiteralExpr>(e)->value}};
    case NodeKind::StringLiteral:
      return json{
        {"type", "StringLiteral"},
        {"range", j_range(e->get_range())},
        {"value", std::string(cast<StringLiteralExpr>(e)->value)}};
    case NodeKind::Path:
      return json{
        {"type", "Path"},
        {"range", j_range(e->get_range())},
        {"name", std::string(cast<PathExpr>(e)->name)}};
    case NodeKind::Binary: {
      const auto * b = cast<BinaryExpr>(e);
      return json{
        {"type", "Binary"},
        {"range", j_range(b->get_range())},
        {"op", std::string(to_string(b->op))},
        {"lhs", j_expr(b->lhs)},
        {"rhs", j_expr(b->rhs)}};
    }
    case NodeKind::Unary: {
      const auto * u = cast<UnaryExpr>(e);
      return json{
        {"type", "Unary"},
        {"range", j_range(u->get_range())},
        {"op", std::string(to_string(u->op))},
        {"operand", j_expr(u->operand)}};
    }
    case NodeKind::Call: {
      const auto * c = cast<CallExpr>(e);
      json args = json::array();
      for (const Expr * a : c->args) args.push_back(j_expr(a));
      return json{
        {"type", "Call"},
        {"range", j_range(c->get_range())},
        {"callee", j_expr(c->callee)},
        {"args", args}};
    }
    case NodeKind::Member: {
      const auto * m = cast<MemberExpr>(e);
      return json{
        {"type", "Member"},
        {"range", j_range(m->get_range())},
        {"base", j_expr(m->base)},
        {"member", std::string(m->member)}};
    }
    default:
      return json{{"type", "MissingExpr"}, {"range", j_range(e->get_range())}};
  }
}

// ============================================================================
// Statements
// ============================================================================

json j_stmt(const Stmt * s)
{
  if (s == nullptr) return nullptr;

  switch (s->get_kind()) {
    case NodeKind::BlockStmt: {
      json stmts = json::array();
      for (const Stmt * child : cast<BlockStmt>(s)->statements) stmts.push_back(j_stmt(child));
      return json{{"type", "Block"}, {"range", j_range(s->get_range())}, {"statements", stmts}};
    }
    case NodeKind::ReturnStmt:
      return json{
        {"type", "Return"},
        {"range", j_range(s->get_range())},
        {"value", j_expr(cast<ReturnStmt>(s)->value)}};
    case NodeKind::DefinitionStmt: {
      const auto * d = cast<DefinitionStmt>(s);
      return json{
        {"type", "Definition"},
        {"range", j_range(d->get_range())},
        {"kind", d->definition == DefinitionKind::Let ? "let" : "const"},
        {"name", std::string(d->name)},
        {"declaredType", j_type(d->type)},
        {"value", j_expr(d->value)}};
    }
    case NodeKind::AssignStmt: {
      const auto * a = cast<AssignStmt>(s);
      return json{
        {"type", "Assign"},
        {"range", j_range(a->get_range())},
        {"op", std::string(to_string(a->op))},
        {"target", j_expr(a->target)},
        {"value", j_expr(a->value)}};
    }
    case NodeKind::ConditionalStmt: {
      const auto * c = cast<ConditionalStmt>(s);
      return json{
        {"type", "Conditional"},
        {"range", j_range(c->get_range())},
        {"condition", j_expr(c->condition)},
        {"then", j_stmt(c->then_block)},
        {"otherwise", j_stmt(c->otherwise)}};
    }
    case NodeKind::IterationStmt: {
      const auto * it = cast<IterationStmt>(s);
      return json{
        {"type", "Iteration"},
        {"range", j_range(it->get_range())},
        {"variable", std::string(it->variable)},
        {"declaredType", j_type(it->type)},
        {"start", j_expr(it->start)},
        {"stop", j_expr(it->stop)},
        {"body", j_stmt(it->body)}};
    }
    case NodeKind::ExpressionStmt:
      return json{
        {"type", "Expression"},
        {"range", j_range(s->get_range())},
        {"expr", j_expr(cast<ExpressionStmt>(s)->expr)}};
    default:
      return nullptr;
  }
}

// ============================================================================
// Imports
// ============================================================================

json j_access(const PackageAccess * access)
{
  return std::visit(
    [&](const auto & a) -> json {
      using T = std::decay_t<decltype(a)>;
      if constexpr (std::is_same_v<T, StarAccess>) {
        return json{{"type", "Star"}, {"range", j_range(a.range)}};
      } else if constexpr (std::is_same_v<T, SymbolAccess>) {
        json j{{"type", "Symbol"}, {"range", j_range(a.range)}, {"symbol", std::string(a.symbol)}};
        j["alias"] = a.alias ? json(std::string(*a.alias)) : json(nullptr);
        return j;
      } else if constexpr (std::is_same_v<T, SubPackageAccess>) {
        return json{{"type", "SubPackage"}, {"package", j_package(a.package)}};
      } else {
        json list = json::array();
        for (const PackageAccess * nested : a.accesses) list.push_back(j_access(nested));
        return json{{"type", "Multiple"}, {"range", j_range(access->get_range())}, {"accesses", list}};
      }
    },
    access->access);
}

json j_package(const Package * p)
{
  return json{
    {"type", "Package"},
    {"range", j_range(p->get_range())},
    {"name", std::string(p->name)},
    {"access", j_access(p->access)}};
}

// ============================================================================
// Declarations
// ============================================================================

json j_circuit(const CircuitDecl * c)
{
  json members = json::array();
  for (const CircuitMember * m : c->members) {
    members.push_back(
      json{{"range", j_range(m->get_range())}, {"name", std::string(m->name)}, {"memberType", j_type(m->type)}});
  }
  return json{
    {"type", c->is_record ? "Record" : "Circuit"},
    {"range", j_range(c->get_range())},
    {"name", std::string(c->name)},
    {"members", members}};
}

json j_function(const FunctionDecl * f)
{
  json inputs = json::array();
  for (const FunctionInput * in : f->inputs) {
    inputs.push_back(json{
      {"range", j_range(in->get_range())},
      {"name", std::string(in->name)},
      {"mode", std::string(to_string(in->mode))},
      {"inputType", j_type(in->type)}});
  }
  return json{
    {"type", "Function"},
    {"range", j_range(f->get_range())},
    {"name", std::string(f->name)},
    {"inputs", inputs},
    {"output", j_type(f->output)},
    {"body", j_stmt(f->body)}};
}

}  // namespace

nlohmann::json to_json(const AstNode * node)
{
  if (node == nullptr) return nullptr;

  if (const auto * p = dyn_cast<Program>(node)) return to_json(p);
  if (const auto * t = dyn_cast<TypeNode>(node)) return j_type(t);
  if (const auto * e = dyn_cast<Expr>(node)) return j_expr(e);
  if (const auto * s = dyn_cast<Stmt>(node)) return j_stmt(s);
  if (const auto * c = dyn_cast<CircuitDecl>(node)) return j_circuit(c);
  if (const auto * f = dyn_cast<FunctionDecl>(node)) return j_function(f);
  if (const auto * i = dyn_cast<ImportDecl>(node)) {
    return json{{"type", "Import"}, {"range", j_range(i->get_range())}, {"package", j_package(i->package)}};
  }
  if (const auto * pkg = dyn_cast<Package>(node)) return j_package(pkg);
  if (const auto * a = dyn_cast<PackageAccess>(node)) return j_access(a);
  return json{{"type", "Unknown"}, {"range", j_range(node->get_range())}};
}

nlohmann::json to_json(const Program * program)
{
  if (program == nullptr) return nullptr;

  json imports = json::array();
  for (const ImportDecl * i : program->imports) imports.push_back(to_json(i));
  json circuits = json::array();
  for (const CircuitDecl * c : program->circuits) circuits.push_back(j_circuit(c));
  json functions = json::array();
  for (const FunctionDecl * f : program->functions) functions.push_back(j_function(f));

  return json{
    {"type", "Program"},
    {"name", std::string(program->name)},
    {"range", j_range(program->get_range())},
    {"imports", imports},
    {"circuits", circuits},
    {"functions", functions}};
}

nlohmann::json to_json(const ProgramContext & context)
{
  json out = json::object();
  for (const auto & [key, definition] : context) {
    out[key] = std::visit(
      [](const auto & def) -> json {
        using T = std::decay_t<decltype(def)>;
        if constexpr (std::is_same_v<T, CircuitDefinition>) {
          return json{
            {"kind", def.decl->is_record ? "record" : "circuit"},
            {"name", std::string(def.decl->name)}};
        } else {
          json j{{"kind", "function"}, {"name", std::string(def.decl->name)}};
          j["callContext"] = def.call_context ? json(*def.call_context) : json(nullptr);
          return j;
        }
      },
      definition);
  }
  return out;
}

}  // namespace circ_dsl
