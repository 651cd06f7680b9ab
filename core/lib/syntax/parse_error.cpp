#include "kaleido/syntax/parse_error.hpp"

namespace kaleido::syntax
{

ParseError ParseError::invalid_token(const Token & t)
{
  return ParseError{ParseErrorKind::InvalidToken, t.kind, std::string(t.text), t.range};
}

ParseError ParseError::invalid_operator(const Token & t)
{
  return ParseError{ParseErrorKind::InvalidOperator, t.kind, std::string(t.text), t.range};
}

ParseError ParseError::unexpected_eof(const Token & eof)
{
  return ParseError{ParseErrorKind::UnexpectedEof, TokenKind::Eof, {}, eof.range};
}

std::string_view ParseError::code() const noexcept
{
  switch (kind) {
    case ParseErrorKind::InvalidToken:
      return "E0001";
    case ParseErrorKind::InvalidOperator:
      return "E0002";
    case ParseErrorKind::UnexpectedEof:
      return "E0003";
  }
  return "";  // not reached: the switch covers every kind
}

std::string ParseError::message() const
{
  switch (kind) {
    case ParseErrorKind::InvalidToken:
      return "invalid token '" + text + "'";
    case ParseErrorKind::InvalidOperator:
      return "invalid operator '" + text + "'";
    case ParseErrorKind::UnexpectedEof:
      return "unexpected end of file";
  }
  return "parse error";  // not reached: the switch covers every kind
}

}  // namespace kaleido::syntax
