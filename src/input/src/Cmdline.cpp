/**
 * @file Cmdline.cpp
 * @brief Implementation of the kernel cmdline adapter.
 */

#include "src/input/inc/Cmdline.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>
#include <array>

#include <fmt/core.h>

namespace kcheck {

namespace input {

namespace {

using kcheck::helpers::files::readTextFile;
using kcheck::helpers::strings::splitWhitespace;
using kcheck::helpers::strings::trim;

/// Parameters the kernel parses itself instead of via kstrtobool().
constexpr std::array<std::string_view, 13> VERBATIM_PARAMS = {
    "debugfs",                   // debugfs_kernel()
    "mitigations",               // mitigations_parse_cmdline()
    "pti",                       // pti_check_boottime_disable()
    "spectre_v2",                // spectre_v2_parse_cmdline()
    "spectre_v2_user",           // spectre_v2_parse_user_cmdline()
    "spec_store_bypass_disable", // ssb_parse_cmdline()
    "l1tf",                      // l1tf_cmdline()
    "mds",                       // mds_cmdline()
    "tsx_async_abort",           // tsx_async_abort_parse_cmdline()
    "srbds",                     // srbds_parse_cmdline()
    "mmio_stale_data",           // mmio_stale_data_parse_cmdline()
    "retbleed",                  // retbleed_parse_cmdline()
    "tsx",                       // tsx_init()
};

constexpr std::array<std::string_view, 9> TRUE_SPELLINGS = {"1",   "on", "On",  "ON", "y",
                                                            "Y",   "yes", "Yes", "YES"};
constexpr std::array<std::string_view, 9> FALSE_SPELLINGS = {"0",  "off", "Off", "OFF", "n",
                                                             "N",  "no",  "No",  "NO"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& set, std::string_view s) noexcept {
  return std::find(set.begin(), set.end(), s) != set.end();
}

} // namespace

std::string normalizeCmdlineValue(std::string_view name, std::string_view value) {
  if (contains(VERBATIM_PARAMS, name)) {
    return std::string{value};
  }
  if (contains(TRUE_SPELLINGS, value)) {
    return "1";
  }
  if (contains(FALSE_SPELLINGS, value)) {
    return "0";
  }
  return std::string{value};
}

bool parseCmdlineText(std::string_view text, std::string_view origin, ParsedOptions& out,
                      std::string& error) noexcept {
  out = ParsedOptions{};

  const std::size_t NL = text.find('\n');
  const std::string_view FIRST = text.substr(0, NL);
  if (NL != std::string_view::npos && !trim(text.substr(NL + 1)).empty()) {
    error = fmt::format("more than one line in \"{}\"", origin);
    return false;
  }

  for (const std::string_view TOKEN : splitWhitespace(FIRST)) {
    const std::size_t EQ = TOKEN.find('=');
    if (EQ == std::string_view::npos) {
      out.assign(std::string{TOKEN}, normalizeCmdlineValue(TOKEN, ""));
      continue;
    }
    const std::string_view NAME = TOKEN.substr(0, EQ);
    out.assign(std::string{NAME}, normalizeCmdlineValue(NAME, TOKEN.substr(EQ + 1)));
  }

  return true;
}

bool parseCmdlineFile(std::string_view path, ParsedOptions& out, std::string& error) noexcept {
  std::string text;
  if (!readTextFile(path, text, error)) {
    return false;
  }
  return parseCmdlineText(text, path, out, error);
}

} // namespace input

} // namespace kcheck
