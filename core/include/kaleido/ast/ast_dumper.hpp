// kaleido/ast/ast_dumper.hpp - Debug AST tree output
#pragma once

#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kaleido/ast/ast.hpp"
#include "kaleido/ast/source_printer.hpp"
#include "kaleido/ast/visitor.hpp"

namespace kaleido
{

/**
 * Dumps AST nodes in a human-readable tree format.
 *
 * @code
 *   Program
 *   |-ExternDecl
 *   | `-Prototype name='sin' params='x'
 *   `-FunctionDecl
 *     |-Prototype name='add' params='x, y'
 *     `-BinaryExpr op='+'
 *       |-VariableExpr name='x'
 *       `-VariableExpr name='y'
 * @endcode
 */
class AstDumper : public AstVisitor<AstDumper, void>
{
public:
  explicit AstDumper(std::ostream & os) : os_(os) {}

  /// Dump an AST node and its subtree
  void dump(AstNode * node)
  {
    visit(node);
    os_ << "\n";
  }

  // ===========================================================================
  // Generic tree printer
  // ===========================================================================

  /// Property for display: key='value', or a bare value when key is empty
  struct Prop
  {
    std::string_view key;
    std::string value;

    Prop(std::string_view k, std::string_view v) : key(k), value(v) {}
    Prop(std::string_view k, std::string v) : key(k), value(std::move(v)) {}
    Prop(std::string_view k, const char * v) : key(k), value(v) {}

    Prop(std::string_view v) : value(v) {}
    Prop(std::string v) : value(std::move(v)) {}
    Prop(const char * v) : value(v) {}

    Prop(double v) : value(format_number(v)) {}
  };

  template <typename... Containers>
  void print_tree(
    std::string_view label, std::initializer_list<Prop> props,
    const Containers &... child_containers)
  {
    print_prefix();
    os_ << label;
    for (const auto & prop : props) {
      if (prop.key.empty()) {
        os_ << " " << prop.value;
      } else {
        os_ << " " << prop.key << "='" << prop.value << "'";
      }
    }
    os_ << "\n";

    std::vector<AstNode *> all_children;
    (collect_children(all_children, child_containers), ...);

    if (!all_children.empty()) {
      const IndentScope scope(*this);
      for (size_t i = 0; i < all_children.size(); ++i) {
        is_last_ = (i == all_children.size() - 1);
        visit(all_children[i]);
      }
    }
  }

  // ===========================================================================
  // Visit methods
  // ===========================================================================

  void visit_program(Program * node)
  {
    // Root is printed without a prefix; its children start at column 0.
    os_ << "Program\n";
    for (size_t i = 0; i < node->items.size(); ++i) {
      is_last_ = (i == node->items.size() - 1);
      visit(node->items[i]);
    }
  }

  // --- Declarations ---
  void visit_function_decl(FunctionDecl * node)
  {
    const std::string_view label = node->is_anonymous() ? "FunctionDecl [anonymous]" : "FunctionDecl";
    print_tree(label, {}, node->proto, node->body);
  }
  void visit_extern_decl(ExternDecl * node) { print_tree("ExternDecl", {}, node->proto); }

  // --- Supporting nodes ---
  void visit_prototype(Prototype * node)
  {
    std::string params;
    for (size_t i = 0; i < node->params.size(); ++i) {
      if (i != 0) params += ", ";
      params += node->params[i];
    }
    print_tree("Prototype", {{"name", node->name}, {"params", std::move(params)}});
  }

  // --- Expressions ---
  void visit_number_expr(NumberExpr * node) { print_tree("NumberExpr", {Prop(node->value)}); }
  void visit_variable_expr(VariableExpr * node)
  {
    print_tree("VariableExpr", {{"name", node->name}});
  }
  void visit_binary_expr(BinaryExpr * node)
  {
    print_tree("BinaryExpr", {{"op", node->op}}, node->lhs, node->rhs);
  }
  void visit_call_expr(CallExpr * node)
  {
    print_tree("CallExpr", {{"callee", node->callee}}, node->args);
  }

private:
  std::ostream & os_;
  std::string prefix_;
  bool is_last_ = true;

  template <typename T>
  void collect_children(std::vector<AstNode *> & out, T * ptr)
  {
    if (ptr) out.push_back(ptr);
  }

  template <typename T>
  void collect_children(std::vector<AstNode *> & out, gsl::span<T *> span)
  {
    for (auto * ptr : span) {
      if (ptr) out.push_back(ptr);
    }
  }

  void print_prefix()
  {
    os_ << prefix_;
    os_ << (is_last_ ? "`-" : "|-");
  }

  struct IndentScope
  {
    AstDumper & d;
    std::string saved;

    explicit IndentScope(AstDumper & dumper) : d(dumper), saved(d.prefix_)
    {
      d.prefix_ += d.is_last_ ? "  " : "| ";
    }

    ~IndentScope() { d.prefix_ = saved; }
  };
};

// ============================================================================
// Convenience Functions
// ============================================================================

inline void dump(AstNode * node, std::ostream & os)
{
  AstDumper dumper(os);
  dumper.dump(node);
}

inline std::string dump_to_string(AstNode * node)
{
  std::ostringstream ss;
  dump(node, ss);
  return ss.str();
}

}  // namespace kaleido
