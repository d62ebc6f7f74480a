// minml/basic/ident.hpp - Interned identifiers
//
// Identifiers are canonicalized through a process-wide, append-only table so
// that equality and hashing reduce to a pointer comparison.
//
#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory_resource>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>

namespace minml
{

/**
 * Append-only intern table shared by every lexer in the process.
 *
 * Lookups take a shared lock; inserting a new string takes the exclusive
 * lock. Interned text lives in a monotonic arena and is never freed.
 */
class IdentTable
{
public:
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit IdentTable(size_t initial_buffer_size = k_default_buffer_size);

  IdentTable(const IdentTable &) = delete;
  IdentTable & operator=(const IdentTable &) = delete;

  /// The table used by Ident::intern(); created on first use.
  [[nodiscard]] static IdentTable & global();

  /// Return the canonical view for `text`, inserting it if needed.
  [[nodiscard]] std::string_view intern(std::string_view text);

  [[nodiscard]] bool contains(std::string_view text) const;
  [[nodiscard]] size_t size() const;

private:
  mutable std::shared_mutex mutex_;
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> pool_;
};

/// An interned, immutable identifier.
class Ident
{
public:
  /// Intern `text` in the global table.
  [[nodiscard]] static Ident intern(std::string_view text);

  /// Intern `text` in a specific table (tests, isolated tools).
  [[nodiscard]] static Ident intern(IdentTable & table, std::string_view text)
  {
    return Ident(table.intern(text));
  }

  [[nodiscard]] std::string_view str() const noexcept { return text_; }
  [[nodiscard]] size_t size() const noexcept { return text_.size(); }

  /// Pointer of the canonical entry; equal identifiers share it.
  [[nodiscard]] const char * data() const noexcept { return text_.data(); }

  [[nodiscard]] bool operator==(Ident other) const noexcept
  {
    return text_.data() == other.text_.data() && text_.size() == other.text_.size();
  }
  [[nodiscard]] bool operator!=(Ident other) const noexcept { return !(*this == other); }

  [[nodiscard]] bool operator==(std::string_view text) const noexcept { return text_ == text; }
  [[nodiscard]] bool operator!=(std::string_view text) const noexcept { return text_ != text; }

private:
  explicit Ident(std::string_view canonical) noexcept : text_(canonical) {}

  std::string_view text_;
};

std::ostream & operator<<(std::ostream & os, Ident id);

}  // namespace minml

namespace std
{

template <>
struct hash<minml::Ident>
{
  size_t operator()(minml::Ident id) const noexcept
  {
    return hash<const void *>{}(static_cast<const void *>(id.data()));
  }
};

}  // namespace std
