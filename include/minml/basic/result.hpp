// minml/basic/result.hpp - Value-or-error result type (C++17 compatible)
#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace minml
{

/// Tag wrapper used to construct a Result in its error state.
template <typename E>
struct Err
{
  E error;
};

template <typename E>
[[nodiscard]] Err<std::decay_t<E>> make_err(E && e)
{
  return {std::forward<E>(e)};
}

/**
 * Holds either a success value T or an error E.
 *
 * Lexing and parsing report failures as values; nothing in the front-end
 * throws on malformed input.
 *
 * @code
 *   auto toks = syntax::lex(id, text);
 *   if (!toks) {
 *     for (const auto & e : toks.error()) { ... }
 *   }
 * @endcode
 */
template <typename T, typename E>
class Result
{
  static_assert(!std::is_same_v<T, E>, "Result requires distinct value and error types");

public:
  using ValueType = T;
  using ErrorType = E;

  Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
  Result(Err<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

  [[nodiscard]] bool has_value() const noexcept { return data_.index() == 0; }
  [[nodiscard]] bool has_error() const noexcept { return data_.index() == 1; }

  explicit operator bool() const noexcept { return has_value(); }

  // Get the value (undefined behavior if has_error())
  T & value() & { return std::get<0>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<0>(data_); }
  T && value() && { return std::get<0>(std::move(data_)); }

  // Get the error (undefined behavior if has_value())
  E & error() & { return std::get<1>(data_); }
  [[nodiscard]] const E & error() const & { return std::get<1>(data_); }
  E && error() && { return std::get<1>(std::move(data_)); }

  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }
  T & operator*() & { return value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, E> data_;
};

}  // namespace minml
