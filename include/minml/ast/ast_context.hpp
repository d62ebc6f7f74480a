// minml/ast/ast_context.hpp - AST arena allocator
//
// AstContext owns every node and child array produced by one parse. Memory
// comes from a std::pmr::monotonic_buffer_resource and is released all at
// once when the context is destroyed.
//
#pragma once

#include <algorithm>
#include <cstddef>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <new>
#include <type_traits>
#include <utility>
#include <vector>

namespace minml
{

class AstNode;

/**
 * Arena owning AST nodes.
 *
 * @code
 *   AstContext ctx;
 *   auto * lit = ctx.create<LiteralExpr>(Literal::make_int(42), span);
 * @endcode
 */
class AstContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size)
  {
  }

  ~AstContext() = default;

  // PMR resources are not movable
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /**
   * Create a node of type T in the arena. The node lives as long as the
   * context; it is never destroyed individually.
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST Node must be trivially destructible to be managed by Arena! "
      "Use gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    ++node_count_;
    return new (mem) T(std::forward<Args>(args)...);
  }

  /// Allocate a value-initialized array of T from the arena.
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /// Copy a temporary child list into the arena.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

  /// Number of nodes created so far.
  [[nodiscard]] size_t node_count() const noexcept { return node_count_; }

private:
  std::pmr::monotonic_buffer_resource arena_;
  size_t node_count_ = 0;
};

}  // namespace minml
