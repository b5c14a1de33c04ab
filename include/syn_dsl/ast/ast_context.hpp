// syn_dsl/ast/ast_context.hpp - Arena that owns AST nodes and their strings
//
// Backed by std::pmr::monotonic_buffer_resource: nodes are never freed
// individually, everything goes away with the context.
//
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

namespace syn_dsl
{

class AstNode;

/**
 * Owner of one parsed Program.
 *
 * Pointers and views handed out stay valid for the lifetime of the context.
 *
 * @code
 *   AstContext ctx;
 *   auto * save = ctx.create<SaveStmt>(ctx.intern("out.json"), range);
 * @endcode
 */
class AstContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~AstContext() = default;

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST nodes are never destroyed; use std::string_view and gsl::span members.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // Strings
  // ===========================================================================

  /// Copy `s` into the arena once and return the shared view.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    const auto it = string_pool_.find(s);
    if (it != string_pool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size() + 1, 1));
    std::memcpy(ptr, s.data(), s.size());
    ptr[s.size()] = '\0';

    const std::string_view stored(ptr, s.size());
    string_pool_.insert(stored);
    return stored;
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return string_pool_.size(); }

  // ===========================================================================
  // Arrays
  // ===========================================================================

  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    static_assert(std::is_trivially_destructible_v<T>, "arena arrays are never destroyed");
    if (vec.empty()) {
      return {};
    }
    T * const ptr = static_cast<T *>(arena_.allocate(sizeof(T) * vec.size(), alignof(T)));
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace syn_dsl
