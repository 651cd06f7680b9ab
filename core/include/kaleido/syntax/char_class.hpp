// kaleido/syntax/char_class.hpp - Character classes of the Kaleido lexer
//
// Source text is UTF-8. Classification works on decoded code points and
// follows the Unicode properties: identifiers start with an Alphabetic code
// point and continue with word characters.
//
#pragma once

#include <cstddef>
#include <string_view>

namespace kaleido::syntax
{

/// One decoded code point and the number of bytes it occupies.
struct CodePoint
{
  char32_t value = 0;
  size_t length = 0;
};

/// Replacement value for a byte that does not start a well-formed sequence.
inline constexpr char32_t k_replacement_char = 0xFFFD;

/**
 * Decode the code point that starts at byte `offset` of `text`.
 *
 * A stray continuation byte or a truncated sequence decodes as
 * k_replacement_char with length 1, so scanning always makes progress.
 * `offset` must be less than `text.size()`.
 */
[[nodiscard]] CodePoint decode_utf8(std::string_view text, size_t offset) noexcept;

/// Unicode White_Space.
[[nodiscard]] bool is_whitespace(char32_t c) noexcept;

/// Unicode Alphabetic.
[[nodiscard]] bool is_ident_start(char32_t c) noexcept;

/// Word character: Alphabetic, a mark, a decimal digit, a connector punctuation or a joiner.
[[nodiscard]] bool is_ident_continue(char32_t c) noexcept;

/// Number literals use ASCII digits only.
[[nodiscard]] constexpr bool is_ascii_digit(char32_t c) noexcept { return c >= '0' && c <= '9'; }

/// `;` `(` `)` `,` have token kinds of their own; `#` starts a comment.
[[nodiscard]] constexpr bool is_reserved_punctuation(char32_t c) noexcept
{
  return c == ';' || c == '(' || c == ')' || c == ',' || c == '#';
}

/**
 * True when `text` is exactly one code point that the lexer turns into an
 * Operator token, i.e. anything that starts no other token.
 */
[[nodiscard]] bool is_operator_lexeme(std::string_view text) noexcept;

}  // namespace kaleido::syntax
