#ifndef KCHECK_REPORT_REPORT_HPP
#define KCHECK_REPORT_REPORT_HPP
/**
 * @file Report.hpp
 * @brief Table, JSON and Kconfig fragment rendering of checklists.
 *
 * Rendering only reads check nodes and their attached results; verdicts are
 * never recomputed here.
 */

#include "src/engine/inc/Check.hpp"
#include "src/input/inc/Detect.hpp"
#include "src/input/inc/ParsedOptions.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcheck {

namespace report {

/* ----------------------------- Constants ----------------------------- */

/// Width of the table without the result column.
inline constexpr std::size_t TABLE_WIDTH = 91;

/// Extra width of the separator lines when results are shown.
inline constexpr std::size_t RESULT_WIDTH = 30;

/* ----------------------------- Mode ----------------------------- */

/**
 * @brief Report mode.
 */
enum class Mode : std::uint8_t {
  DEFAULT = 0, ///< Plain table
  VERBOSE,     ///< Table with composite children and unknown options
  JSON,        ///< JSON array, no status lines
  SHOW_OK,     ///< Table of OK checks only
  SHOW_FAIL,   ///< Table of FAIL checks only
};

/// CLI tokens of the non-default modes, in listing order.
inline constexpr std::array<std::string_view, 4> MODE_TOKENS = {"verbose", "json", "show_ok",
                                                                "show_fail"};

/**
 * @brief Convert Mode to its CLI token ("default" for DEFAULT).
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] const char* toString(Mode mode) noexcept;

/// @brief Parse a CLI mode token; nullopt if unknown.
[[nodiscard]] std::optional<Mode> modeFromString(std::string_view token) noexcept;

/* ----------------------------- Tally ----------------------------- */

/**
 * @brief Top-level verdict counts.
 */
struct Tally {
  std::size_t ok{0};
  std::size_t fail{0};
  std::size_t unknown{0};
};

/// @brief Count top-level verdicts (unevaluated checks are not counted).
[[nodiscard]] Tally tally(const engine::Checklist& checklist) noexcept;

/* ----------------------------- Rendering ----------------------------- */

/**
 * @brief Render the fixed-width table.
 * @param checklist   Checks to render, in order.
 * @param mode        Report mode (JSON is treated as DEFAULT).
 * @param withResults Append the result column, filtering and footer.
 * @return Table text, newline-terminated.
 */
[[nodiscard]] std::string formatTable(const engine::Checklist& checklist, Mode mode,
                                      bool withResults);

/**
 * @brief Render one JSON array with an object per top-level check.
 * @return Single-line JSON text (no trailing newline).
 */
[[nodiscard]] std::string formatJson(const engine::Checklist& checklist, bool withResults);

/// @brief formatJson() for Mode::JSON (plus newline), formatTable() otherwise.
[[nodiscard]] std::string formatChecklist(const engine::Checklist& checklist, Mode mode,
                                          bool withResults);

/**
 * @brief Render a Kconfig fragment of the recommended settings.
 *
 * The first line selects the microarchitecture. Refinement targets and
 * checks without a concrete value are skipped; names are emitted once.
 */
[[nodiscard]] std::string formatFragment(input::Arch arch, const engine::Checklist& checklist);

/// @brief "[?] No check for option <name> (<value>)" lines.
[[nodiscard]] std::string formatUnknownOptions(const std::vector<input::ParsedOption>& options);

} // namespace report

} // namespace kcheck

#endif // KCHECK_REPORT_REPORT_HPP
