#ifndef KCHECK_HELPERS_STRINGS_HPP
#define KCHECK_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String scanning helpers for line-oriented text formats.
 *
 * All functions operate on std::string_view and never allocate unless they
 * return an owning container.
 */

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcheck {
namespace helpers {
namespace strings {

/* ----------------------------- Classification ----------------------------- */

/// True for the whitespace characters found in config and cmdline files.
[[nodiscard]] constexpr bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

/// True for characters allowed in a Kconfig symbol name ([A-Za-z0-9_]).
[[nodiscard]] constexpr bool isSymbolChar(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
         c == '_';
}

/**
 * @brief Check that a string is a non-empty run of ASCII digits.
 * @note No allocation.
 */
[[nodiscard]] constexpr bool isDigits(std::string_view s) noexcept {
  if (s.empty()) {
    return false;
  }
  for (const char C : s) {
    if (C < '0' || C > '9') {
      return false;
    }
  }
  return true;
}

/* ----------------------------- Trimming ----------------------------- */

/**
 * @brief Strip leading and trailing whitespace.
 * @param s Input view.
 * @return Sub-view without surrounding whitespace.
 */
[[nodiscard]] constexpr std::string_view trim(std::string_view s) noexcept {
  while (!s.empty() && isSpace(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && isSpace(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

/**
 * @brief Remove one pair of surrounding double quotes, if present.
 * @param s Input view (e.g. "\"lsm,yama\"").
 * @return Unquoted sub-view, or s unchanged.
 */
[[nodiscard]] constexpr std::string_view unquote(std::string_view s) noexcept {
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

/* ----------------------------- Prefix Scanning ----------------------------- */

/// Check if str starts with prefix.
[[nodiscard]] constexpr bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

/**
 * @brief Length of the leading run of Kconfig symbol characters.
 * @param s Input view.
 * @return Number of leading [A-Za-z0-9_] characters.
 */
[[nodiscard]] constexpr std::size_t symbolLength(std::string_view s) noexcept {
  std::size_t n = 0;
  while (n < s.size() && isSymbolChar(s[n])) {
    ++n;
  }
  return n;
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split on runs of whitespace, dropping empty fields.
 * @param s Input view.
 * @return Views into s.
 * @note Allocates the result vector.
 */
[[nodiscard]] inline std::vector<std::string_view> splitWhitespace(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && isSpace(s[i])) {
      ++i;
    }
    const std::size_t START = i;
    while (i < s.size() && !isSpace(s[i])) {
      ++i;
    }
    if (i > START) {
      out.push_back(s.substr(START, i - START));
    }
  }
  return out;
}

/**
 * @brief Split on a single delimiter character, keeping empty fields.
 * @param s Input view.
 * @param delim Delimiter.
 * @return Views into s (always at least one element).
 */
[[nodiscard]] inline std::vector<std::string_view> split(std::string_view s, char delim) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  for (;;) {
    const std::size_t POS = s.find(delim, start);
    if (POS == std::string_view::npos) {
      out.push_back(s.substr(start));
      return out;
    }
    out.push_back(s.substr(start, POS - start));
    start = POS + 1;
  }
}

/* ----------------------------- Numbers ----------------------------- */

/**
 * @brief Parse a whole string as a signed decimal integer.
 * @param s Input view (surrounding quotes are not accepted).
 * @return Value, or nullopt if s is not entirely a decimal integer.
 * @note No allocation.
 */
[[nodiscard]] inline std::optional<std::int64_t> parseInt(std::string_view s) noexcept {
  if (s.empty()) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const char* const BEGIN = s.data();
  const char* const END = s.data() + s.size();
  const auto RES = std::from_chars(BEGIN, END, value, 10);
  if (RES.ec != std::errc{} || RES.ptr != END) {
    return std::nullopt;
  }
  return value;
}

} // namespace strings
} // namespace helpers
} // namespace kcheck

#endif // KCHECK_HELPERS_STRINGS_HPP
