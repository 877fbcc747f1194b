/**
 * @file KernelVersion.cpp
 * @brief Kernel version pair formatting and parsing.
 */

#include "src/input/inc/KernelVersion.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <limits>

#include <fmt/core.h>

namespace kcheck {

namespace input {

namespace {

using kcheck::helpers::strings::isDigits;
using kcheck::helpers::strings::parseInt;

/// Parse a version component; rejects signs and values beyond int range.
std::optional<int> parseComponent(std::string_view s) noexcept {
  if (!isDigits(s)) {
    return std::nullopt;
  }
  const auto VAL = parseInt(s);
  if (!VAL || *VAL > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(*VAL);
}

} // namespace

std::string KernelVersion::toString() const { return fmt::format("{}.{}", major, minor); }

std::optional<KernelVersion> parseKernelVersion(std::string_view text) noexcept {
  const std::size_t DOT = text.find('.');
  if (DOT == std::string_view::npos) {
    return std::nullopt;
  }
  const auto MAJOR = parseComponent(text.substr(0, DOT));
  const auto MINOR = parseComponent(text.substr(DOT + 1));
  if (!MAJOR || !MINOR) {
    return std::nullopt;
  }
  return KernelVersion{*MAJOR, *MINOR};
}

} // namespace input

} // namespace kcheck
