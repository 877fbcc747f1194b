/**
 * @file Detect.cpp
 * @brief Implementation of arch, kernel version and compiler detection.
 */

#include "src/input/inc/Detect.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <vector>

#include <fmt/core.h>

namespace kcheck {

namespace input {

namespace {

using kcheck::helpers::files::splitLines;
using kcheck::helpers::strings::isDigits;
using kcheck::helpers::strings::split;
using kcheck::helpers::strings::splitWhitespace;
using kcheck::helpers::strings::startsWith;
using kcheck::helpers::strings::symbolLength;
using kcheck::helpers::strings::trim;

constexpr std::string_view BANNER_PREFIX = "# Linux/";
constexpr std::string_view BANNER_SUFFIX = " Kernel Configuration";
constexpr std::string_view GCC_MARKER = "CONFIG_GCC_VERSION=";
constexpr std::string_view CLANG_MARKER = "CONFIG_CLANG_VERSION=";

/// Symbol of a "CONFIG_<SYM>=y..." line without the CONFIG_ prefix, or empty.
std::string_view enabledSymbol(std::string_view line) noexcept {
  if (!startsWith(line, "CONFIG_")) {
    return {};
  }
  const std::string_view REST = line.substr(7);
  const std::size_t LEN = symbolLength(REST);
  if (!startsWith(REST.substr(LEN), "=y")) {
    return {};
  }
  return REST.substr(0, LEN);
}

/// True for "# Linux/<anything> Kernel Configuration..." banner lines.
bool isBanner(std::string_view line) noexcept {
  return startsWith(line, BANNER_PREFIX) &&
         line.find(BANNER_SUFFIX, BANNER_PREFIX.size()) != std::string_view::npos;
}

/// Marker value with trailing whitespace removed; nullopt if the marker is absent.
std::optional<std::string> markerValue(const std::vector<std::string_view>& lines,
                                       std::string_view marker) {
  std::optional<std::string> value;
  for (const std::string_view LINE : lines) {
    if (startsWith(LINE, marker)) {
      value = std::string{trim(LINE.substr(marker.size()))};
    }
  }
  return value;
}

} // namespace

/* ----------------------------- Arch ----------------------------- */

const char* toString(Arch arch) noexcept {
  switch (arch) {
  case Arch::X86_64:
    return "X86_64";
  case Arch::X86_32:
    return "X86_32";
  case Arch::ARM64:
    return "ARM64";
  case Arch::ARM:
    return "ARM";
  }
  return "unknown";
}

std::optional<Arch> archFromString(std::string_view token) noexcept {
  for (const Arch A : SUPPORTED_ARCHS) {
    if (token == toString(A)) {
      return A;
    }
  }
  return std::nullopt;
}

/* ----------------------------- Compiler ----------------------------- */

std::string CompilerInfo::toString() const {
  switch (family) {
  case Compiler::GCC:
    return "GCC " + version;
  case Compiler::CLANG:
    return "CLANG " + version;
  case Compiler::UNKNOWN:
    break;
  }
  return "unknown";
}

/* ----------------------------- API ----------------------------- */

bool detectArch(std::string_view text, Arch& arch, std::string& error) noexcept {
  std::optional<Arch> found;

  for (const std::string_view LINE : splitLines(text)) {
    const std::string_view SYM = enabledSymbol(LINE);
    if (SYM.empty()) {
      continue;
    }
    const auto A = archFromString(SYM);
    if (!A) {
      continue;
    }
    if (found) {
      error = "more than one supported microarchitecture is detected";
      return false;
    }
    found = A;
  }

  if (!found) {
    error = "failed to detect microarchitecture";
    return false;
  }
  arch = *found;
  return true;
}

bool detectKernelVersion(std::string_view text, KernelVersion& version,
                         std::string& error) noexcept {
  for (const std::string_view RAW : splitLines(text)) {
    if (!isBanner(RAW)) {
      continue;
    }

    // "# Linux/x86 6.1.0 Kernel Configuration" -> "6.1.0"
    const auto FIELDS = splitWhitespace(RAW);
    const std::string_view VER = FIELDS.size() > 2 ? FIELDS[2] : std::string_view{};
    const auto PARTS = split(VER, '.');
    if (PARTS.size() < 3 || !isDigits(PARTS[0]) || !isDigits(PARTS[1])) {
      error = fmt::format("failed to parse the version \"{}\"", VER);
      return false;
    }
    const auto PARSED = parseKernelVersion(fmt::format("{}.{}", PARTS[0], PARTS[1]));
    if (!PARSED) {
      error = fmt::format("failed to parse the version \"{}\"", VER);
      return false;
    }
    version = *PARSED;
    return true;
  }

  error = "no kernel version detected";
  return false;
}

bool detectCompiler(std::string_view text, CompilerInfo& info, std::string& note) noexcept {
  info = CompilerInfo{};

  const auto LINES = splitLines(text);
  const auto GCC = markerValue(LINES, GCC_MARKER);
  const auto CLANG = markerValue(LINES, CLANG_MARKER);

  if (!GCC || !CLANG) {
    note = "no CONFIG_GCC_VERSION or CONFIG_CLANG_VERSION";
    return true;
  }

  if (*GCC == "0" && *CLANG != "0") {
    info.family = Compiler::CLANG;
    info.version = *CLANG;
    return true;
  }
  if (*GCC != "0" && *CLANG == "0") {
    info.family = Compiler::GCC;
    info.version = *GCC;
    return true;
  }

  note = fmt::format("invalid GCC_VERSION and CLANG_VERSION: {} {}", *GCC, *CLANG);
  return false;
}

} // namespace input

} // namespace kcheck
