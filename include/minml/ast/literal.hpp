// minml/ast/literal.hpp - Literal values
#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace minml
{

enum class LiteralKind : uint8_t {
  Int,
  Char,
  Bool,
  Real,
  Unit,
};

/**
 * A literal constant. Int holds a non-negative magnitude; negation is a
 * unary operator applied to the literal.
 */
class Literal
{
public:
  struct UnitValue
  {
    bool operator==(UnitValue /*other*/) const noexcept { return true; }
  };

  [[nodiscard]] static Literal make_int(uint64_t v)
  {
    return Literal(Storage{std::in_place_index<0>, v});
  }
  [[nodiscard]] static Literal make_char(char32_t c)
  {
    return Literal(Storage{std::in_place_index<1>, c});
  }
  [[nodiscard]] static Literal make_bool(bool b)
  {
    return Literal(Storage{std::in_place_index<2>, b});
  }
  [[nodiscard]] static Literal make_real(double d)
  {
    return Literal(Storage{std::in_place_index<3>, d});
  }
  [[nodiscard]] static Literal unit()
  {
    return Literal(Storage{std::in_place_index<4>});
  }

  [[nodiscard]] LiteralKind kind() const noexcept
  {
    return static_cast<LiteralKind>(value_.index());
  }

  [[nodiscard]] uint64_t as_int() const { return std::get<0>(value_); }
  [[nodiscard]] char32_t as_char() const { return std::get<1>(value_); }
  [[nodiscard]] bool as_bool() const { return std::get<2>(value_); }
  [[nodiscard]] double as_real() const { return std::get<3>(value_); }

  [[nodiscard]] bool operator==(const Literal & other) const { return value_ == other.value_; }
  [[nodiscard]] bool operator!=(const Literal & other) const { return !(*this == other); }

private:
  // Alternative order matches LiteralKind.
  using Storage = std::variant<uint64_t, char32_t, bool, double, UnitValue>;

  explicit Literal(Storage v) : value_(v) {}

  Storage value_;
};

/// Source-like rendering: `42`, `'a'`, `true`, `1.5`, `()`.
[[nodiscard]] std::string to_string(const Literal & lit);

}  // namespace minml
