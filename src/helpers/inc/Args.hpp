#ifndef KCHECK_HELPERS_ARGS_HPP
#define KCHECK_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flag parser with optional short aliases (e.g. "-c" for
 * "--config"). Tokens that match no flag are rejected.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace kcheck {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;    ///< Long flag string, e.g. "--config"
  std::string_view alias{}; ///< Short alias, e.g. "-c" (optional)
  std::uint8_t nargs{0};    ///< Number of values required after the flag
  bool required{false};     ///< True if flag must be provided
  std::string_view desc{};  ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

namespace detail {

/// Compact, parse-ready view of an argument definition.
struct ArgDefView {
  std::uint8_t key;
  std::uint8_t need;
  std::string_view flag;
};

/// Help column text for one definition, e.g. "-c, --config <value>".
inline std::string flagColumn(const ArgDef& def) {
  std::string out;
  out.reserve(40);
  if (!def.alias.empty()) {
    out.append(def.alias);
    out.append(", ");
  }
  out.append(def.flag);
  if (def.nargs > 1) {
    out.append(" <value> ...");
  } else if (def.nargs == 1) {
    out.append(" <value>");
  }
  return out;
}

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * Fixed-arity parser: when a flag or its alias is matched, it consumes the
 * next nargs tokens literally as its values. A flag given twice keeps the
 * last occurrence.
 *
 * @param args   Argument list (non-owning views; must outlive the call).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (entries are overwritten per key).
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on error (and sets error if provided).
 * @note Cold-path: Allocates internally.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) noexcept {
  const std::size_t N = args.size();
  if (N == 0) {
    if (error) {
      error->get() = "No arguments provided";
    }
    return false;
  }

  // Reverse LUT: flag and alias -> compact view
  std::unordered_map<std::string_view, detail::ArgDefView> lut;
  lut.reserve(map.size() * 2);
  for (const auto& KV : map) {
    const detail::ArgDefView VIEW{KV.first, KV.second.nargs, KV.second.flag};
    lut.emplace(KV.second.flag, VIEW);
    if (!KV.second.alias.empty()) {
      lut.emplace(KV.second.alias, VIEW);
    }
  }

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = args[i];
    auto it = lut.find(TOK);
    if (it == lut.end()) {
      if (error) {
        error->get() = fmt::format("Unrecognized argument '{}'", TOK);
      }
      return false;
    }

    const detail::ArgDefView& D = it->second;

    if (i + static_cast<std::size_t>(D.need) >= N) {
      if (error) {
        error->get() = fmt::format("Argument out of bounds: expected {} values for flag '{}'",
                                   static_cast<unsigned int>(D.need), D.flag);
      }
      return false;
    }

    auto& out = pargs[D.key];
    out.clear();
    out.reserve(D.need);
    for (std::uint8_t k = 0; k < D.need; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }

    i += D.need;
  }

  for (const auto& KV : map) {
    if (KV.second.required && pargs.count(KV.first) == 0) {
      if (error) {
        error->get() = fmt::format("Missing required argument '{}'", KV.second.flag);
      }
      return false;
    }
  }

  return true;
}

/**
 * @brief Print usage information for a CLI tool.
 *
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 * @note Cold-path: Performs I/O.
 */
inline void printUsage(const char* progName, std::string_view description,
                       const ArgMap& map) noexcept {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  fmt::print("Options:\n");

  std::vector<std::pair<std::string, const ArgDef*>> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.emplace_back(detail::flagColumn(KV.second), &KV.second);
  }
  std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
    return a.second->flag < b.second->flag;
  });

  std::size_t width = 16;
  for (const auto& ENTRY : entries) {
    width = std::max(width, ENTRY.first.size());
  }
  width = std::min<std::size_t>(width, 30);

  for (const auto& ENTRY : entries) {
    const ArgDef& DEF = *ENTRY.second;
    fmt::print("  {:<{}}  {}", ENTRY.first, width, DEF.desc);
    if (DEF.required) {
      fmt::print("{}(required)", DEF.desc.empty() ? "" : " ");
    }
    fmt::print("\n");
  }
}

} // namespace args
} // namespace helpers
} // namespace kcheck

#endif // KCHECK_HELPERS_ARGS_HPP
