/**
 * @file Kconfig.cpp
 * @brief Implementation of the Kconfig file adapter.
 */

#include "src/input/inc/Kconfig.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <fmt/core.h>

namespace kcheck {

namespace input {

namespace {

using kcheck::helpers::files::readTextFile;
using kcheck::helpers::files::splitLines;
using kcheck::helpers::strings::startsWith;
using kcheck::helpers::strings::symbolLength;
using kcheck::helpers::strings::trim;

constexpr std::string_view ON_PREFIX = "CONFIG_";
constexpr std::string_view OFF_PREFIX = "# CONFIG_";
constexpr std::string_view OFF_SUFFIX = " is not set";

/// Kind of a trimmed Kconfig line.
enum class LineKind : unsigned char { OTHER = 0, ENABLED, DISABLED };

/// Classify a trimmed line; name/value are set for ENABLED and DISABLED.
LineKind classify(std::string_view line, std::string_view& name, std::string_view& value) noexcept {
  if (startsWith(line, ON_PREFIX)) {
    const std::size_t END = ON_PREFIX.size() + symbolLength(line.substr(ON_PREFIX.size()));
    if (END < line.size() && line[END] == '=') {
      name = line.substr(0, END);
      value = line.substr(END + 1);
      return LineKind::ENABLED;
    }
    return LineKind::OTHER;
  }

  if (startsWith(line, OFF_PREFIX)) {
    const std::size_t END = OFF_PREFIX.size() + symbolLength(line.substr(OFF_PREFIX.size()));
    if (startsWith(line.substr(END), OFF_SUFFIX)) {
      name = line.substr(2, END - 2);
      value = line.substr(END + 1);
      return LineKind::DISABLED;
    }
  }

  return LineKind::OTHER;
}

} // namespace

bool parseKconfigText(std::string_view text, ParsedOptions& out, std::string& error) noexcept {
  out = ParsedOptions{};

  for (const std::string_view RAW : splitLines(text)) {
    const std::string_view LINE = trim(RAW);
    std::string_view name;
    std::string_view value;

    switch (classify(LINE, name, value)) {
    case LineKind::ENABLED:
      if (value == OFF_MARKER) {
        error = fmt::format("bad enabled Kconfig option \"{}\"", LINE);
        return false;
      }
      break;
    case LineKind::DISABLED:
      if (value != OFF_MARKER) {
        error = fmt::format("bad disabled Kconfig option \"{}\"", LINE);
        return false;
      }
      break;
    case LineKind::OTHER:
      continue;
    }

    if (!out.insert(std::string{name}, std::string{value})) {
      error = fmt::format("Kconfig option \"{}\" exists multiple times", LINE);
      return false;
    }
  }

  return true;
}

bool parseKconfigFile(std::string_view path, ParsedOptions& out, std::string& error) noexcept {
  std::string text;
  if (!readTextFile(path, text, error)) {
    return false;
  }
  return parseKconfigText(text, out, error);
}

} // namespace input

} // namespace kcheck
