// kaleido/ast/json_visitor.cpp - JSON serialization implementation
//
#include "kaleido/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "kaleido/ast/ast.hpp"
#include "kaleido/basic/casting.hpp"
#include "kaleido/basic/source_file.hpp"

namespace kaleido
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
  return json{{"start", r.begin()}, {"end", r.end()}};
}

json j_proto(const Prototype * p)
{
  json params = json::array();
  for (const auto param : p->params) {
    params.push_back(std::string(param));
  }
  return json{
    {"type", "Prototype"},
    {"range", j_range(p->get_range())},
    {"name", std::string(p->name)},
    {"params", params}};
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_expr(const Expr * e)
{
  if (!e) return json{{"type", "MissingExpr"}, {"range", j_range({})}};

  if (isa<NumberExpr>(e)) {
    const auto * n = cast<NumberExpr>(e);
    return json{{"type", "NumberExpr"}, {"range", j_range(n->get_range())}, {"value", n->value}};
  }

  if (isa<VariableExpr>(e)) {
    const auto * v = cast<VariableExpr>(e);
    return json{
      {"type", "VariableExpr"}, {"range", j_range(v->get_range())}, {"name", std::string(v->name)}};
  }

  if (isa<BinaryExpr>(e)) {
    const auto * b = cast<BinaryExpr>(e);
    return json{
      {"type", "BinaryExpr"},
      {"range", j_range(b->get_range())},
      {"op", std::string(b->op)},
      {"lhs", j_expr(b->lhs)},
      {"rhs", j_expr(b->rhs)}};
  }

  if (isa<CallExpr>(e)) {
    const auto * c = cast<CallExpr>(e);
    json args = json::array();
    for (const auto * arg : c->args) {
      args.push_back(j_expr(arg));
    }
    return json{
      {"type", "CallExpr"},
      {"range", j_range(c->get_range())},
      {"callee", std::string(c->callee)},
      {"args", args}};
  }

  return json{{"type", "UnknownExpr"}, {"range", j_range(e->get_range())}};
}

// ============================================================================
// Declaration serialization
// ============================================================================

json j_decl(const Decl * d)
{
  if (!d) return json{{"type", "MissingDecl"}, {"range", j_range({})}};

  if (isa<FunctionDecl>(d)) {
    const auto * f = cast<FunctionDecl>(d);
    return json{
      {"type", "FunctionDecl"},
      {"range", j_range(f->get_range())},
      {"anonymous", f->is_anonymous()},
      {"prototype", j_proto(f->proto)},
      {"body", j_expr(f->body)}};
  }

  if (isa<ExternDecl>(d)) {
    const auto * x = cast<ExternDecl>(d);
    return json{
      {"type", "ExternDecl"}, {"range", j_range(x->get_range())}, {"prototype", j_proto(x->proto)}};
  }

  return json{{"type", "UnknownDecl"}, {"range", j_range(d->get_range())}};
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nlohmann::json{{"type", "null"}, {"range", j_range({})}};

  if (isa<Program>(node)) {
    return to_json(cast<Program>(node));
  }
  if (isa<Decl>(node)) {
    return j_decl(cast<Decl>(node));
  }
  if (isa<Expr>(node)) {
    return j_expr(cast<Expr>(node));
  }
  if (isa<Prototype>(node)) {
    return j_proto(cast<Prototype>(node));
  }

  return nlohmann::json{{"type", "Unknown"}, {"range", j_range(node->get_range())}};
}

nlohmann::json to_json(const Program * program)
{
  if (!program)
    return nlohmann::json{
      {"type", "Program"}, {"range", j_range({})}, {"items", nlohmann::json::array()}};

  nlohmann::json items = nlohmann::json::array();
  for (const auto * d : program->items) items.push_back(j_decl(d));

  return nlohmann::json{
    {"type", "Program"}, {"range", j_range(program->get_range())}, {"items", items}};
}

}  // namespace kaleido
