#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kaleido::syntax
{

/**
 * Binding powers of the binary operators a parser accepts.
 *
 * Keys are single operator characters as the lexer produces them; a higher
 * power binds tighter. Parsers hold a const reference, so a table must
 * outlive every parser that uses it.
 */
class OperatorTable
{
public:
  /// An empty table: every operator is rejected.
  OperatorTable() = default;

  /// `*` and `/` at 40, `+` and `-` at 20.
  [[nodiscard]] static const OperatorTable & defaults();

  [[nodiscard]] std::optional<uint32_t> find(std::string_view symbol) const;
  [[nodiscard]] bool contains(std::string_view symbol) const { return find(symbol).has_value(); }

  /// Insert or overwrite. Throws std::invalid_argument unless `symbol` lexes
  /// as exactly one operator token.
  void set(std::string_view symbol, uint32_t power);

  /// Returns false when the symbol was not present.
  bool erase(std::string_view symbol);

  /// Symbols in lexicographic byte order.
  [[nodiscard]] std::vector<std::string> symbols() const;

  [[nodiscard]] size_t size() const noexcept { return powers_.size(); }
  [[nodiscard]] bool empty() const noexcept { return powers_.empty(); }

private:
  std::map<std::string, uint32_t, std::less<>> powers_;
};

}  // namespace kaleido::syntax
