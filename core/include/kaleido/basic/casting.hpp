// kaleido/basic/casting.hpp - Checked downcasts for the AST hierarchy
//
// Each node class answers `static bool classof(const AstNode *)`, so a node's
// NodeKind decides the cast without RTTI:
//
//   if (auto * call = dyn_cast<CallExpr>(expr)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace kaleido
{

/// `To *`, or `const To *` when casting from a pointer to const.
template <typename To, typename From>
using cast_ptr_t = std::conditional_t<std::is_const_v<From>, const To *, To *>;

/// False for nullptr.
template <typename To, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return node != nullptr && To::classof(node);
}

/// Downcast a node known to be a `To`.
template <typename To, typename From>
[[nodiscard]] inline cast_ptr_t<To, From> cast(From * node) noexcept
{
  assert(isa<To>(node) && "cast<To>() on a node of another kind");
  return static_cast<cast_ptr_t<To, From>>(node);
}

/// Downcast, or nullptr when `node` is null or not a `To`.
template <typename To, typename From>
[[nodiscard]] inline cast_ptr_t<To, From> dyn_cast(From * node) noexcept
{
  return isa<To>(node) ? static_cast<cast_ptr_t<To, From>>(node) : nullptr;
}

}  // namespace kaleido
