#ifndef KCHECK_INPUT_KCONFIG_HPP
#define KCHECK_INPUT_KCONFIG_HPP
/**
 * @file Kconfig.hpp
 * @brief Kconfig (.config) file adapter.
 *
 * Recognized line shapes (after trimming):
 *  - "CONFIG_NAME=value"          enabled, value kept verbatim (quotes included)
 *  - "# CONFIG_NAME is not set"   disabled, recorded as OFF_MARKER
 * Every other line is ignored.
 *
 * Errors (the whole parse fails):
 *  - enabled line whose value is the disabled marker
 *  - disabled line with trailing text other than "is not set"
 *  - an option name that appears twice
 */

#include "src/input/inc/ParsedOptions.hpp"

#include <string>
#include <string_view>

namespace kcheck {

namespace input {

/**
 * @brief Parse Kconfig text.
 * @param text  File contents.
 * @param out   Receives options in file order (cleared first).
 * @param error Receives a message on failure.
 * @return true on success.
 */
[[nodiscard]] bool parseKconfigText(std::string_view text, ParsedOptions& out,
                                    std::string& error) noexcept;

/**
 * @brief Read and parse a Kconfig file (plain or gzip-compressed).
 * @param path  File path.
 * @param out   Receives options in file order (cleared first).
 * @param error Receives a message on failure.
 * @return true on success.
 */
[[nodiscard]] bool parseKconfigFile(std::string_view path, ParsedOptions& out,
                                    std::string& error) noexcept;

} // namespace input

} // namespace kcheck

#endif // KCHECK_INPUT_KCONFIG_HPP
