// kaleido/ast/source_printer.cpp - Canonical source printer
//
#include "kaleido/ast/source_printer.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace kaleido
{

std::string format_number(double value)
{
  // Fixed notation of DBL_MAX needs 309 integral digits.
  std::array<char, 512> buf{};
  const auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value,
                                       std::chars_format::fixed);
  if (ec != std::errc{}) {
    throw std::logic_error("format_number: buffer too small");
  }
  return std::string(buf.data(), end);
}

void SourcePrinter::visit_program(const Program * node)
{
  for (const auto * item : node->items) {
    visit(item);
    os_ << "\n";
  }
}

void SourcePrinter::visit_function_decl(const FunctionDecl * node)
{
  if (!node->is_anonymous()) {
    os_ << "def ";
    visit(node->proto);
    os_ << " ";
  }
  visit(node->body);
  os_ << ";";
}

void SourcePrinter::visit_extern_decl(const ExternDecl * node)
{
  os_ << "extern ";
  visit(node->proto);
  os_ << ";";
}

void SourcePrinter::visit_prototype(const Prototype * node)
{
  os_ << node->name << "(";
  for (size_t i = 0; i < node->params.size(); ++i) {
    if (i != 0) os_ << ", ";
    os_ << node->params[i];
  }
  os_ << ")";
}

void SourcePrinter::visit_number_expr(const NumberExpr * node)
{
  if (std::isinf(node->value) && node->value > 0) {
    // No literal spells infinity; an integer literal past DBL_MAX lexes back to it.
    os_ << "1" << std::string(309, '0');
    return;
  }
  os_ << format_number(node->value);
}

void SourcePrinter::visit_variable_expr(const VariableExpr * node) { os_ << node->name; }

void SourcePrinter::visit_binary_expr(const BinaryExpr * node)
{
  os_ << "(";
  visit(node->lhs);
  os_ << " " << node->op << " ";
  visit(node->rhs);
  os_ << ")";
}

void SourcePrinter::visit_call_expr(const CallExpr * node)
{
  os_ << node->callee << "(";
  for (size_t i = 0; i < node->args.size(); ++i) {
    if (i != 0) os_ << ", ";
    visit(node->args[i]);
  }
  os_ << ")";
}

std::string print_source(const AstNode * node)
{
  std::ostringstream ss;
  SourcePrinter printer(ss);
  printer.visit(node);
  return ss.str();
}

}  // namespace kaleido
