#include "kaleido/syntax/operator_table.hpp"

#include <stdexcept>

#include "kaleido/syntax/char_class.hpp"

namespace kaleido::syntax
{

const OperatorTable & OperatorTable::defaults()
{
  static const OperatorTable table = [] {
    OperatorTable t;
    t.set("*", 40);
    t.set("/", 40);
    t.set("+", 20);
    t.set("-", 20);
    return t;
  }();
  return table;
}

std::optional<uint32_t> OperatorTable::find(std::string_view symbol) const
{
  const auto it = powers_.find(symbol);
  if (it == powers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void OperatorTable::set(std::string_view symbol, uint32_t power)
{
  if (!is_operator_lexeme(symbol)) {
    throw std::invalid_argument("'" + std::string(symbol) + "' is not a single operator character");
  }
  powers_.insert_or_assign(std::string(symbol), power);
}

bool OperatorTable::erase(std::string_view symbol)
{
  const auto it = powers_.find(symbol);
  if (it == powers_.end()) {
    return false;
  }
  powers_.erase(it);
  return true;
}

std::vector<std::string> OperatorTable::symbols() const
{
  std::vector<std::string> out;
  out.reserve(powers_.size());
  for (const auto & entry : powers_) {
    out.push_back(entry.first);
  }
  return out;
}

}  // namespace kaleido::syntax
