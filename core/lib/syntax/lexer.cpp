#include "kaleido/syntax/lexer.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "kaleido/syntax/char_class.hpp"
#include "kaleido/syntax/keywords.hpp"

namespace kaleido::syntax
{

void Lexer::skip_whitespace_and_comments()
{
  while (!eof()) {
    const CodePoint cp = current();
    if (is_whitespace(cp.value)) {
      advance(cp.length);
      continue;
    }
    if (cp.value == '#') {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }
    break;
  }
}

Token Lexer::lex_identifier_or_keyword()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(current().length);
  while (!eof()) {
    const CodePoint cp = current();
    if (!is_ident_continue(cp.value)) {
      break;
    }
    advance(cp.length);
  }
  const auto end = static_cast<uint32_t>(pos_);

  Token t;
  t.range = make_range(start, end);
  t.text = src_.substr(start, end - start);
  t.kind = keyword_kind(t.text).value_or(TokenKind::Identifier);
  return t;
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);

  while (!eof() && is_ascii_digit(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  // Optional fraction; "1." is a complete literal.
  if (!eof() && peek() == '.') {
    advance(1);
    while (!eof() && is_ascii_digit(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
  }

  const auto end = static_cast<uint32_t>(pos_);
  Token t;
  t.kind = TokenKind::Number;
  t.range = make_range(start, end);
  t.text = src_.substr(start, end - start);

  // Overflow is not an error: strtod saturates to HUGE_VAL (+inf).
  const std::string s(t.text);
  char * parse_end = nullptr;
  t.number = std::strtod(s.c_str(), &parse_end);
  if (parse_end != s.c_str() + s.size()) {
    throw std::logic_error("lexer produced a number literal strtod cannot read: '" + s + "'");
  }
  return t;
}

Token Lexer::lex_operator()
{
  const auto start = static_cast<uint32_t>(pos_);
  // Invalid UTF-8 advances one byte at a time.
  const size_t len = current().length;
  advance(len);
  const auto end = static_cast<uint32_t>(pos_);

  Token t;
  t.kind = TokenKind::Operator;
  t.range = make_range(start, end);
  t.text = src_.substr(start, end - start);
  return t;
}

Token Lexer::next_token()
{
  skip_whitespace_and_comments();

  if (eof()) {
    Token t;
    t.kind = TokenKind::Eof;
    const auto at = static_cast<uint32_t>(src_.size());
    t.range = make_range(at, at);
    return t;
  }

  const CodePoint cp = current();

  if (is_ident_start(cp.value)) {
    return lex_identifier_or_keyword();
  }
  if (is_ascii_digit(cp.value)) {
    return lex_number();
  }

  const auto start = static_cast<uint32_t>(pos_);
  const auto punct = [&](TokenKind kind) {
    advance(1);
    const auto end = static_cast<uint32_t>(pos_);
    return Token{kind, make_range(start, end), src_.substr(start, 1)};
  };

  switch (peek()) {
    case ';':
      return punct(TokenKind::Delimiter);
    case '(':
      return punct(TokenKind::LParen);
    case ')':
      return punct(TokenKind::RParen);
    case ',':
      return punct(TokenKind::Comma);
    default:
      break;
  }

  return lex_operator();
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

std::vector<Token> tokenize(std::string_view src, FileId file_id)
{
  return Lexer(file_id, src).lex_all();
}

}  // namespace kaleido::syntax
