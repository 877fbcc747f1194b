#ifndef KCHECK_HELPERS_FORMAT_HPP
#define KCHECK_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Text formatting utilities shared by report writers.
 *
 * @note NOT RT-SAFE: All functions return std::string (heap allocation).
 */

#include <string>
#include <string_view>

#include <fmt/core.h>
#include <fmt/format.h>

namespace kcheck {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Escape a string for inclusion in a JSON string literal.
 * @param s Raw text.
 * @return Escaped text without surrounding quotes.
 */
[[nodiscard]] inline std::string jsonEscape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (const char C : s) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned int>(C));
      } else {
        out += C;
      }
      break;
    }
  }
  return out;
}

/**
 * @brief Format a JSON string literal (quoted and escaped).
 * @param s Raw text.
 * @return e.g. "\"CONFIG_BUG\"".
 */
[[nodiscard]] inline std::string jsonString(std::string_view s) {
  return fmt::format("\"{}\"", jsonEscape(s));
}

/**
 * @brief Join strings with a separator.
 * @tparam Range Iterable of string-like elements.
 * @param parts Elements to join.
 * @param sep   Separator placed between elements.
 */
template <typename Range>
[[nodiscard]] std::string join(const Range& parts, std::string_view sep) {
  std::string out;
  bool first = true;
  for (const auto& PART : parts) {
    if (!first) {
      out += sep;
    }
    out += PART;
    first = false;
  }
  return out;
}

} // namespace format
} // namespace helpers
} // namespace kcheck

#endif // KCHECK_HELPERS_FORMAT_HPP
