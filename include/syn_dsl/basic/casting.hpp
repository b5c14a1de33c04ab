// syn_dsl/basic/casting.hpp - isa/cast/dyn_cast over classof()-based hierarchies
//
//   if (isa<FromStmt>(stmt)) { ... }
//   const auto * from = cast<FromStmt>(stmt);           // kind must match
//   if (const auto * gen = dyn_cast<GenerateStmt>(stmt)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace syn_dsl
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

}  // namespace detail

/// True when `node` is non-null and of dynamic kind T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::HasClassof<T, From>::value, "T must provide classof()");
  return node != nullptr && T::classof(node);
}

/// Checked downcast; the kind is asserted in debug builds.
template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of another kind");
  return static_cast<const T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(isa<T>(static_cast<const From *>(node)) && "cast<T>() on a node of another kind");
  return static_cast<T *>(node);
}

/// Downcast that yields nullptr on a kind mismatch.
template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node)) ? static_cast<T *>(node) : nullptr;
}

}  // namespace syn_dsl
