// minml/basic/span.hpp - Source identifiers, spans and spanned values
//
// A Span is a half-open byte range [start, end) inside one registered source.
// Line/column information is never stored here; it is computed on demand by
// SourceRegistry.
//
#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <type_traits>
#include <utility>

namespace minml
{

// ============================================================================
// SourceId - Opaque per-file handle
// ============================================================================

struct SourceId
{
  static constexpr uint32_t k_invalid = UINT32_MAX;

  uint32_t value = k_invalid;

  [[nodiscard]] static constexpr SourceId invalid() noexcept { return {}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(SourceId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(SourceId other) const noexcept
  {
    return value != other.value;
  }
};

// ============================================================================
// SourceSpan - Renderer-facing (src, offset, length) projection
// ============================================================================

struct SourceSpan
{
  SourceId src;
  uint32_t offset = 0;
  uint32_t length = 0;

  [[nodiscard]] constexpr bool operator==(const SourceSpan & other) const noexcept
  {
    return src == other.src && offset == other.offset && length == other.length;
  }
};

// ============================================================================
// Span - Half-open byte range in a single source
// ============================================================================

class Span
{
public:
  /// Create an invalid span (no source)
  constexpr Span() noexcept = default;

  /// Create a span over [start, end) of `src`. Requires start <= end.
  constexpr Span(SourceId src, uint32_t start, uint32_t end) noexcept
  : src_(src), start_(start), end_(end)
  {
    assert(start <= end && "span start must not exceed its end");
  }

  [[nodiscard]] constexpr SourceId src() const noexcept { return src_; }
  [[nodiscard]] constexpr uint32_t start() const noexcept { return start_; }
  [[nodiscard]] constexpr uint32_t end() const noexcept { return end_; }

  [[nodiscard]] constexpr uint32_t len() const noexcept { return end_ - start_; }
  [[nodiscard]] constexpr bool is_empty() const noexcept { return start_ == end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return src_.is_valid(); }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !src_.is_valid(); }

  /// Check if a byte offset lies inside this span
  [[nodiscard]] constexpr bool contains(uint32_t offset) const noexcept
  {
    return offset >= start_ && offset < end_;
  }

  /// Check if another span of the same source is fully covered by this one
  [[nodiscard]] constexpr bool contains(Span other) const noexcept
  {
    return src_ == other.src_ && other.start_ >= start_ && other.end_ <= end_;
  }

  /**
   * Smallest span covering both operands (min start, max end).
   *
   * Both spans must come from the same source. An invalid operand is
   * ignored so that joins can be folded starting from Span{}.
   */
  [[nodiscard]] constexpr Span join(Span other) const noexcept
  {
    if (is_invalid()) return other;
    if (other.is_invalid()) return *this;
    assert(src_ == other.src_ && "cannot join spans from different sources");
    return {src_, std::min(start_, other.start_), std::max(end_, other.end_)};
  }

  /// Alias of join()
  [[nodiscard]] constexpr Span merge(Span other) const noexcept { return join(other); }

  /// Project to the (src, offset, length) triple consumed by renderers
  [[nodiscard]] constexpr SourceSpan to_source_span() const noexcept
  {
    return {src_, start_, len()};
  }

  [[nodiscard]] constexpr bool operator==(Span other) const noexcept
  {
    return src_ == other.src_ && start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(Span other) const noexcept { return !(*this == other); }

private:
  SourceId src_;
  uint32_t start_ = 0;
  uint32_t end_ = 0;
};

// ============================================================================
// Spanned<T> - A value paired with its span
// ============================================================================

template <typename T>
class Spanned
{
public:
  using value_type = T;

  constexpr Spanned(T value, Span span) : value_(std::move(value)), span_(span) {}

  [[nodiscard]] constexpr Span span() const noexcept { return span_; }

  [[nodiscard]] constexpr const T & value() const & noexcept { return value_; }
  [[nodiscard]] constexpr T & value() & noexcept { return value_; }
  [[nodiscard]] constexpr T && value() && noexcept { return std::move(value_); }

  [[nodiscard]] constexpr const T & operator*() const & noexcept { return value_; }
  [[nodiscard]] constexpr T & operator*() & noexcept { return value_; }
  [[nodiscard]] constexpr const T * operator->() const noexcept { return &value_; }
  [[nodiscard]] constexpr T * operator->() noexcept { return &value_; }

  /// Transform the inner value; the span is carried over unchanged.
  template <typename F>
  [[nodiscard]] auto map(F && f) const & -> Spanned<std::invoke_result_t<F, const T &>>
  {
    return {std::invoke(std::forward<F>(f), value_), span_};
  }

  template <typename F>
  [[nodiscard]] auto map(F && f) && -> Spanned<std::invoke_result_t<F, T &&>>
  {
    return {std::invoke(std::forward<F>(f), std::move(value_)), span_};
  }

  /// Borrow the inner value immutably, keeping the span
  [[nodiscard]] Spanned<std::reference_wrapper<const T>> as_ref() const noexcept
  {
    return {std::cref(value_), span_};
  }

  /// Borrow the inner value mutably, keeping the span
  [[nodiscard]] Spanned<std::reference_wrapper<T>> as_mut() noexcept
  {
    return {std::ref(value_), span_};
  }

  /// Copy of this value re-tagged with a different span
  [[nodiscard]] Spanned with_span(Span span) const & { return {value_, span}; }
  [[nodiscard]] Spanned with_span(Span span) && { return {std::move(value_), span}; }

  void set_span(Span span) noexcept { span_ = span; }

  [[nodiscard]] bool operator==(const Spanned & other) const
  {
    return span_ == other.span_ && value_ == other.value_;
  }
  [[nodiscard]] bool operator!=(const Spanned & other) const { return !(*this == other); }

private:
  T value_;
  Span span_;
};

template <typename T>
[[nodiscard]] Spanned<std::decay_t<T>> spanned(T && value, Span span)
{
  return {std::forward<T>(value), span};
}

namespace detail
{

inline size_t hash_combine(size_t seed, size_t v) noexcept
{
  return seed ^ (v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

}  // namespace detail

}  // namespace minml

namespace std
{

template <>
struct hash<minml::SourceId>
{
  size_t operator()(minml::SourceId id) const noexcept { return hash<uint32_t>{}(id.value); }
};

template <>
struct hash<minml::Span>
{
  size_t operator()(minml::Span s) const noexcept
  {
    size_t h = hash<minml::SourceId>{}(s.src());
    h = minml::detail::hash_combine(h, hash<uint32_t>{}(s.start()));
    return minml::detail::hash_combine(h, hash<uint32_t>{}(s.end()));
  }
};

template <typename T>
struct hash<minml::Spanned<T>>
{
  size_t operator()(const minml::Spanned<T> & s) const
  {
    return minml::detail::hash_combine(hash<T>{}(s.value()), hash<minml::Span>{}(s.span()));
  }
};

}  // namespace std
