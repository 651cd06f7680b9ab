// kaleido/ast/ast_context.hpp - Storage for one parsed Kaleido program
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace kaleido
{

class AstNode;

/**
 * Owns the nodes, name strings and child lists of a parse.
 *
 * Everything is carved from one monotonic arena and released together when
 * the context goes away, so a Program stays usable after the source text and
 * token stream are gone. Nodes are never destroyed individually and must be
 * trivially destructible.
 *
 * @code
 *   AstContext ast;
 *   auto * x = ast.make<VariableExpr>(ast.intern("x"));
 *   auto * call = ast.make<CallExpr>(ast.intern("f"), ast.list(std::vector<Expr *>{x}));
 * @endcode
 */
class AstContext
{
public:
  AstContext() : names_(&arena_) {}

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;

  /// Construct a node in the arena.
  template <typename T, typename... Args>
  T * make(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "make<T>() builds AST nodes only");
    static_assert(std::is_trivially_destructible_v<T>, "arena nodes are never destroyed");

    ++node_count_;
    return new (arena_.allocate(sizeof(T), alignof(T))) T(std::forward<Args>(args)...);
  }

  /**
   * Arena copy of an identifier or operator spelling. Equal spellings share
   * one copy, so names can be compared by pointer as well as by value.
   */
  [[nodiscard]] std::string_view intern(std::string_view spelling)
  {
    if (const auto it = names_.find(spelling); it != names_.end()) {
      return *it;
    }
    auto * storage = static_cast<char *>(arena_.allocate(spelling.size(), alignof(char)));
    std::memcpy(storage, spelling.data(), spelling.size());
    return *names_.emplace(storage, spelling.size()).first;
  }

  /// Arena copy of a child list collected while parsing.
  template <typename T>
  [[nodiscard]] gsl::span<T> list(const std::vector<T> & items)
  {
    static_assert(std::is_trivially_copyable_v<T>, "child lists hold pointers or names");
    if (items.empty()) {
      return {};
    }
    auto * storage = static_cast<T *>(arena_.allocate(sizeof(T) * items.size(), alignof(T)));
    std::uninitialized_copy(items.begin(), items.end(), storage);
    return gsl::span<T>(storage, items.size());
  }

  /// Nodes made so far.
  [[nodiscard]] size_t node_count() const noexcept { return node_count_; }

  /// Distinct names interned so far.
  [[nodiscard]] size_t name_count() const noexcept { return names_.size(); }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> names_;
  size_t node_count_ = 0;
};

}  // namespace kaleido
