#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "kaleido/ast/ast.hpp"
#include "kaleido/ast/ast_context.hpp"
#include "kaleido/syntax/operator_table.hpp"
#include "kaleido/syntax/parse_error.hpp"
#include "kaleido/syntax/token.hpp"

namespace kaleido::syntax
{

/**
 * Recursive-descent parser with precedence climbing for binary operators.
 *
 * There is no error recovery: the first error stops the parse, the entry
 * point returns nullptr and error() describes what went wrong. Nodes are
 * created in `ast`; names are interned there, so the tree does not refer to
 * the token source.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, std::vector<Token> tokens,
    const OperatorTable & operators = OperatorTable::defaults());

  /// Parse top-level items until end of input.
  [[nodiscard]] Program * parse_program();

  /// Parse one expression from the current position.
  [[nodiscard]] Expr * parse_expression();

  [[nodiscard]] const std::optional<ParseError> & error() const noexcept { return error_; }

  /// True once every token before Eof has been consumed.
  [[nodiscard]] bool at_eof() const { return at(TokenKind::Eof); }

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k);

  // Error helpers: record the first error and return nullptr
  std::nullptr_t fail(ParseError err);
  std::nullptr_t fail_at(const Token & t);

  // Top-level
  [[nodiscard]] FunctionDecl * parse_definition();
  [[nodiscard]] ExternDecl * parse_extern();
  [[nodiscard]] FunctionDecl * parse_top_level_expr();
  [[nodiscard]] Prototype * parse_prototype();

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_call(const Token & callee);
  [[nodiscard]] Expr * parse_rhs(uint64_t min_precedence, Expr * lhs);

  AstContext & ast_;
  std::vector<Token> tokens_;
  const OperatorTable & operators_;
  size_t idx_ = 0;
  std::optional<ParseError> error_;
};

}  // namespace kaleido::syntax
