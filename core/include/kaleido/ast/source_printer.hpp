// kaleido/ast/source_printer.hpp - Canonical source text for AST nodes
//
// The printer emits text that parses back to a structurally identical AST:
// every binary sub-expression is parenthesised and numbers are written in
// shortest round-trip fixed notation.
//
#pragma once

#include <ostream>
#include <string>

#include "kaleido/ast/ast.hpp"
#include "kaleido/ast/visitor.hpp"

namespace kaleido
{

/// Shortest decimal text that reads back as `value`, never in exponent form.
[[nodiscard]] std::string format_number(double value);

/**
 * Writes canonical source for any AST node.
 *
 * @code
 *   def add(x, y) (x + y);
 *   extern sin(x);
 *   ((1 - 2) - 3);
 * @endcode
 *
 * Top-level items of a Program are written one per line.
 */
class SourcePrinter : public ConstAstVisitor<SourcePrinter, void>
{
public:
  explicit SourcePrinter(std::ostream & os) : os_(os) {}

  void visit_program(const Program * node);
  void visit_function_decl(const FunctionDecl * node);
  void visit_extern_decl(const ExternDecl * node);
  void visit_prototype(const Prototype * node);

  void visit_number_expr(const NumberExpr * node);
  void visit_variable_expr(const VariableExpr * node);
  void visit_binary_expr(const BinaryExpr * node);
  void visit_call_expr(const CallExpr * node);

private:
  std::ostream & os_;
};

/// Print a node (typically a Program or an Expr) to a string.
[[nodiscard]] std::string print_source(const AstNode * node);

}  // namespace kaleido
