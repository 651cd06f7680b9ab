#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include "kaleido/syntax/token.hpp"

namespace kaleido::syntax
{

inline constexpr std::array<std::pair<std::string_view, TokenKind>, 2> k_keywords = {{
  {"def", TokenKind::Def},
  {"extern", TokenKind::Extern},
}};

/// Keyword kind for an identifier-shaped lexeme, if it is reserved.
[[nodiscard]] constexpr std::optional<TokenKind> keyword_kind(std::string_view text) noexcept
{
  for (const auto & entry : k_keywords) {
    if (entry.first == text) {
      return entry.second;
    }
  }
  return std::nullopt;
}

}  // namespace kaleido::syntax
