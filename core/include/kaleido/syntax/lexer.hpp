#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "kaleido/syntax/char_class.hpp"
#include "kaleido/syntax/token.hpp"

namespace kaleido::syntax
{

/**
 * Hand-written scanner producing tokens in source order.
 *
 * Never fails on input: every non-whitespace code point that starts no other
 * token becomes a one-code-point Operator. Identifiers are Unicode-aware
 * (see char_class.hpp); numbers use ASCII digits. `#` comments run to end of line and
 * produce no tokens.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

  /// All tokens followed by a single Eof.
  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }

  /// Code point at the current position; only valid when !eof().
  [[nodiscard]] CodePoint current() const noexcept { return decode_utf8(src_, pos_); }

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace_and_comments();

  [[nodiscard]] Token lex_identifier_or_keyword();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_operator();

  [[nodiscard]] SourceRange make_range(uint32_t start, uint32_t end) const noexcept
  {
    return {file_id_, start, end};
  }

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
};

/// Convenience wrapper: `Lexer(file_id, src).lex_all()`.
[[nodiscard]] std::vector<Token> tokenize(std::string_view src, FileId file_id = FileId{0});

}  // namespace kaleido::syntax
