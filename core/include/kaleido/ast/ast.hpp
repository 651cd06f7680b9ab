// kaleido/ast/ast.hpp - AST node class definitions
//
// Node classes follow the LLVM/Clang style with classof() for RTTI support.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "kaleido/ast/ast_enums.hpp"
#include "kaleido/basic/casting.hpp"
#include "kaleido/basic/source_file.hpp"

namespace kaleido
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has a NodeKind for RTTI and the SourceRange it was parsed
 * from. Nodes are non-copyable and owned by an AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

/// Base class for expressions.
class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Base class for top-level declarations.
class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Numeric literal. The language has a single 64-bit floating point type.
class NumberExpr : public NodeBase<NumberExpr, Expr, NodeKind::Number>
{
public:
  double value;

  explicit NumberExpr(double v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Reference to a named value (function parameter).
class VariableExpr : public NodeBase<VariableExpr, Expr, NodeKind::Variable>
{
public:
  std::string_view name;

  explicit VariableExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Infix binary expression. `op` is the single-character operator symbol.
class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  std::string_view op;
  Expr * lhs;
  Expr * rhs;

  BinaryExpr(std::string_view o, Expr * l, Expr * r, SourceRange range = {})
  : NodeBase(range), op(o), lhs(l), rhs(r)
  {
  }
};

/// Function call: callee(args...).
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  std::string_view callee;
  gsl::span<Expr *> args;

  CallExpr(std::string_view c, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), callee(c), args(a)
  {
  }
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// Function signature: name and ordered parameter names.
class Prototype : public NodeBase<Prototype, AstNode, NodeKind::Prototype>
{
public:
  std::string_view name;
  gsl::span<std::string_view> params;

  Prototype(std::string_view n, gsl::span<std::string_view> p, SourceRange r = {})
  : NodeBase(r), name(n), params(p)
  {
  }

  /// Top-level expressions are wrapped in a nameless, parameterless prototype.
  [[nodiscard]] bool is_anonymous() const noexcept { return name.empty(); }
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/// `def name(params) body`, or an anonymous top-level expression.
class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::FunctionDecl>
{
public:
  Prototype * proto;
  Expr * body;

  FunctionDecl(Prototype * p, Expr * b, SourceRange r = {}) : NodeBase(r), proto(p), body(b) {}

  [[nodiscard]] bool is_anonymous() const noexcept { return proto->is_anonymous(); }
};

/// `extern name(params)`: a signature with no body.
class ExternDecl : public NodeBase<ExternDecl, Decl, NodeKind::ExternDecl>
{
public:
  Prototype * proto;

  explicit ExternDecl(Prototype * p, SourceRange r = {}) : NodeBase(r), proto(p) {}
};

// ============================================================================
// Program (Root Node)
// ============================================================================

/// Top-level declarations in source order.
class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Decl *> items;

  explicit Program(gsl::span<Decl *> i, SourceRange r = {}) : NodeBase(r), items(i) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace kaleido
