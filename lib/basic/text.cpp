// minml/basic/text.cpp - Unicode scalar helpers
#include "minml/basic/text.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace minml
{

std::string encode_utf8(char32_t c)
{
  std::string out;
  const auto cp = static_cast<uint32_t>(c);
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  return out;
}

std::string quote_char(char32_t c)
{
  switch (c) {
    case U'\n':
      return "'\\n'";
    case U'\r':
      return "'\\r'";
    case U'\t':
      return "'\\t'";
    case U'\0':
      return "'\\0'";
    case U'\'':
      return "'\\''";
    case U'\\':
      return "'\\\\'";
    default:
      return "'" + encode_utf8(c) + "'";
  }
}

std::string format_real(double v)
{
  char buf[40];
  for (int precision = 1; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
    if (std::strtod(buf, nullptr) == v) {
      break;
    }
  }

  std::string out(buf);
  if (out.find_first_of(".eni") == std::string::npos) {
    out += ".0";
  }
  return out;
}

}  // namespace minml
