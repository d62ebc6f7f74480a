// minml/basic/text.hpp - Text rendering helpers for literals
#pragma once

#include <string>

namespace minml
{

/// Encode a Unicode scalar as UTF-8.
[[nodiscard]] std::string encode_utf8(char32_t c);

/// Character literal as it would be written in source, e.g. `'\n'`.
[[nodiscard]] std::string quote_char(char32_t c);

/// Shortest decimal form that reads back to `v`, always marked as real
/// (`1.0`, `0.1`, `2.5e+20`).
[[nodiscard]] std::string format_real(double v);

}  // namespace minml
