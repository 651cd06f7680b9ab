// kaleido/syntax/char_class.cpp - UTF-8 decoding and Unicode character classes
//
// Property lookups go through ICU's uchar API.
//
#include "kaleido/syntax/char_class.hpp"

#include <unicode/uchar.h>

namespace kaleido::syntax
{

namespace
{

bool is_continuation(unsigned char b) { return (b & 0xC0) == 0x80; }

UChar32 to_uchar32(char32_t c) { return static_cast<UChar32>(c); }

}  // namespace

CodePoint decode_utf8(std::string_view text, size_t offset) noexcept
{
  const auto b0 = static_cast<unsigned char>(text[offset]);
  if (b0 < 0x80) {
    return {b0, 1};
  }

  const size_t remaining = text.size() - offset;
  const auto bits = [&](size_t i) {
    return static_cast<char32_t>(static_cast<unsigned char>(text[offset + i]) & 0x3FU);
  };
  const auto continues = [&](size_t count) {
    for (size_t i = 1; i <= count; ++i) {
      if (!is_continuation(static_cast<unsigned char>(text[offset + i]))) return false;
    }
    return true;
  };

  if ((b0 & 0xE0) == 0xC0 && remaining >= 2 && continues(1)) {
    return {(static_cast<char32_t>(b0 & 0x1FU) << 6) | bits(1), 2};
  }
  if ((b0 & 0xF0) == 0xE0 && remaining >= 3 && continues(2)) {
    return {(static_cast<char32_t>(b0 & 0x0FU) << 12) | (bits(1) << 6) | bits(2), 3};
  }
  if ((b0 & 0xF8) == 0xF0 && remaining >= 4 && continues(3)) {
    return {
      (static_cast<char32_t>(b0 & 0x07U) << 18) | (bits(1) << 12) | (bits(2) << 6) | bits(3), 4};
  }
  return {k_replacement_char, 1};
}

bool is_whitespace(char32_t c) noexcept { return u_isUWhiteSpace(to_uchar32(c)) != 0; }

bool is_ident_start(char32_t c) noexcept
{
  return u_hasBinaryProperty(to_uchar32(c), UCHAR_ALPHABETIC) != 0;
}

bool is_ident_continue(char32_t c) noexcept
{
  const UChar32 u = to_uchar32(c);
  if (u_hasBinaryProperty(u, UCHAR_ALPHABETIC) || u_hasBinaryProperty(u, UCHAR_JOIN_CONTROL)) {
    return true;
  }
  return (U_GET_GC_MASK(u) & (U_GC_M_MASK | U_GC_ND_MASK | U_GC_PC_MASK)) != 0;
}

bool is_operator_lexeme(std::string_view text) noexcept
{
  if (text.empty()) {
    return false;
  }
  const CodePoint cp = decode_utf8(text, 0);
  if (cp.length != text.size()) {
    return false;
  }
  return !is_whitespace(cp.value) && !is_ident_start(cp.value) && !is_ascii_digit(cp.value) &&
         !is_reserved_punctuation(cp.value);
}

}  // namespace kaleido::syntax
