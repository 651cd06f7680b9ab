#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "kaleido/basic/source_file.hpp"
#include "kaleido/syntax/token.hpp"

namespace kaleido::syntax
{

enum class ParseErrorKind : uint8_t {
  InvalidToken,     // a token that cannot appear here
  InvalidOperator,  // an operator with no binding power in the table
  UnexpectedEof,    // input ended inside a construct
};

[[nodiscard]] constexpr std::string_view to_string(ParseErrorKind k) noexcept
{
  switch (k) {
    case ParseErrorKind::InvalidToken:
      return "InvalidToken";
    case ParseErrorKind::InvalidOperator:
      return "InvalidOperator";
    case ParseErrorKind::UnexpectedEof:
      return "UnexpectedEof";
  }
  return "";
}

/**
 * The first error of a failed parse, reported where it was detected.
 */
struct ParseError
{
  ParseErrorKind kind = ParseErrorKind::InvalidToken;
  TokenKind token = TokenKind::Eof;  // offending token kind
  std::string text;                  // offending lexeme (empty at end of input)
  SourceRange range;

  [[nodiscard]] static ParseError invalid_token(const Token & t);
  [[nodiscard]] static ParseError invalid_operator(const Token & t);
  [[nodiscard]] static ParseError unexpected_eof(const Token & eof);

  /// Stable diagnostic code, e.g. "E0002".
  [[nodiscard]] std::string_view code() const noexcept;

  /// e.g. "invalid operator ':'"
  [[nodiscard]] std::string message() const;
};

}  // namespace kaleido::syntax
