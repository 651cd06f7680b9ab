#include "kaleido/syntax/parser.hpp"

#include <utility>

namespace kaleido::syntax
{

Parser::Parser(AstContext & ast, std::vector<Token> tokens, const OperatorTable & operators)
: ast_(ast), tokens_(std::move(tokens)), operators_(operators)
{
  // The cursor relies on a trailing Eof sentinel.
  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    Token eof;
    if (!tokens_.empty()) {
      const SourceRange last = tokens_.back().range;
      eof.range = SourceRange::at(last.file(), last.end());
    }
    tokens_.push_back(eof);
  }
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k)
{
  if (match(k)) {
    return true;
  }
  fail_at(cur());
  return false;
}

std::nullptr_t Parser::fail(ParseError err)
{
  if (!error_) {
    error_ = std::move(err);
  }
  return nullptr;
}

std::nullptr_t Parser::fail_at(const Token & t)
{
  if (t.kind == TokenKind::Eof) {
    return fail(ParseError::unexpected_eof(t));
  }
  return fail(ParseError::invalid_token(t));
}

// ============================================================================
// Top-level
// ============================================================================

Program * Parser::parse_program()
{
  if (error_) return nullptr;

  std::vector<Decl *> items;
  while (!at_eof()) {
    if (match(TokenKind::Delimiter)) {
      continue;
    }

    Decl * item = nullptr;
    if (at(TokenKind::Def)) {
      item = parse_definition();
    } else if (at(TokenKind::Extern)) {
      item = parse_extern();
    } else {
      item = parse_top_level_expr();
    }
    if (!item) {
      return nullptr;
    }
    items.push_back(item);
  }

  const SourceRange eof = cur().range;
  return ast_.make<Program>(ast_.list(items), SourceRange(eof.file(), 0, eof.end()));
}

FunctionDecl * Parser::parse_definition()
{
  const Token & kw = advance();  // def
  Prototype * proto = parse_prototype();
  if (!proto) return nullptr;
  Expr * body = parse_expr();
  if (!body) return nullptr;
  return ast_.make<FunctionDecl>(proto, body, cover(kw.range, body->get_range()));
}

ExternDecl * Parser::parse_extern()
{
  const Token & kw = advance();  // extern
  Prototype * proto = parse_prototype();
  if (!proto) return nullptr;
  return ast_.make<ExternDecl>(proto, cover(kw.range, proto->get_range()));
}

FunctionDecl * Parser::parse_top_level_expr()
{
  Expr * body = parse_expr();
  if (!body) return nullptr;

  const SourceRange r = body->get_range();
  auto * proto = ast_.make<Prototype>(
    std::string_view{}, gsl::span<std::string_view>{}, SourceRange::at(r.file(), r.begin()));
  return ast_.make<FunctionDecl>(proto, body, r);
}

Prototype * Parser::parse_prototype()
{
  const Token & name = cur();
  if (!expect(TokenKind::Identifier)) return nullptr;
  if (!expect(TokenKind::LParen)) return nullptr;

  std::vector<std::string_view> params;
  if (!at(TokenKind::RParen)) {
    while (true) {
      const Token & param = cur();
      if (!expect(TokenKind::Identifier)) return nullptr;
      params.push_back(ast_.intern(param.text));

      if (match(TokenKind::Comma)) continue;
      if (at(TokenKind::RParen)) break;
      return fail_at(cur());
    }
  }

  const Token & rp = advance();  // )
  return ast_.make<Prototype>(
    ast_.intern(name.text), ast_.list(params), cover(name.range, rp.range));
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expression()
{
  if (error_) return nullptr;
  return parse_expr();
}

Expr * Parser::parse_expr()
{
  Expr * lhs = parse_primary();
  if (!lhs) return nullptr;
  return parse_rhs(0, lhs);
}

Expr * Parser::parse_primary()
{
  const Token & t = cur();

  switch (t.kind) {
    case TokenKind::Number:
      advance();
      return ast_.make<NumberExpr>(t.number, t.range);

    case TokenKind::Identifier:
      advance();
      if (at(TokenKind::LParen)) {
        return parse_call(t);
      }
      return ast_.make<VariableExpr>(ast_.intern(t.text), t.range);

    case TokenKind::LParen: {
      advance();
      Expr * inner = parse_expr();
      if (!inner) return nullptr;
      const Token & rp = cur();
      if (!expect(TokenKind::RParen)) return nullptr;
      inner->range_ = cover(t.range, rp.range);
      return inner;
    }

    default:
      return fail_at(t);
  }
}

Expr * Parser::parse_call(const Token & callee)
{
  advance();  // (

  std::vector<Expr *> args;
  if (!at(TokenKind::RParen)) {
    while (true) {
      Expr * arg = parse_expr();
      if (!arg) return nullptr;
      args.push_back(arg);

      if (match(TokenKind::Comma)) continue;
      if (at(TokenKind::RParen)) break;
      return fail_at(cur());
    }
  }

  const Token & rp = advance();  // )
  return ast_.make<CallExpr>(
    ast_.intern(callee.text), ast_.list(args), cover(callee.range, rp.range));
}

// Precedence climbing: fold operators of at least `min_precedence` into lhs,
// letting a strictly tighter operator to the right take the operand first.
Expr * Parser::parse_rhs(uint64_t min_precedence, Expr * lhs)
{
  while (at(TokenKind::Operator)) {
    const Token & op = cur();
    const auto precedence = operators_.find(op.text);
    if (!precedence) {
      return fail(ParseError::invalid_operator(op));
    }
    if (*precedence < min_precedence) {
      return lhs;
    }
    advance();

    Expr * rhs = parse_primary();
    if (!rhs) return nullptr;

    if (at(TokenKind::Operator)) {
      const Token & next = cur();
      const auto next_precedence = operators_.find(next.text);
      if (!next_precedence) {
        return fail(ParseError::invalid_operator(next));
      }
      if (*next_precedence > *precedence) {
        rhs = parse_rhs(uint64_t{*precedence} + 1, rhs);
        if (!rhs) return nullptr;
      }
    }

    lhs = ast_.make<BinaryExpr>(
      ast_.intern(op.text), lhs, rhs, cover(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

}  // namespace kaleido::syntax
