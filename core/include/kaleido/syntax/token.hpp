#pragma once

#include <cstdint>
#include <string_view>

#include "kaleido/basic/source_file.hpp"

namespace kaleido::syntax
{

enum class TokenKind : uint8_t {
  Eof,  // end-of-input sentinel; always the last token of a lexed stream

  // Keywords
  Def,
  Extern,

  // Punctuation
  Delimiter,  // ;
  LParen,
  RParen,
  Comma,

  Identifier,
  Operator,  // any other single non-whitespace character
  Number,
};

struct Token
{
  TokenKind kind = TokenKind::Eof;
  SourceRange range;      // byte range in the source text
  std::string_view text;  // slice view of the lexeme
  double number = 0.0;    // parsed value (Number only)

  [[nodiscard]] uint32_t begin() const noexcept { return range.begin(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.end(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Def:
      return "def";
    case TokenKind::Extern:
      return "extern";
    case TokenKind::Delimiter:
      return ";";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::Operator:
      return "operator";
    case TokenKind::Number:
      return "number";
  }
  return "<unknown>";
}

}  // namespace kaleido::syntax
