#ifndef KCHECK_INPUT_CMDLINE_HPP
#define KCHECK_INPUT_CMDLINE_HPP
/**
 * @file Cmdline.hpp
 * @brief Kernel command line (/proc/cmdline) adapter.
 *
 * The file holds exactly one line of space-separated "name" or
 * "name=value" tokens. Values are normalized the way the kernel's
 * kstrtobool() reads them, except for parameters with their own parser.
 * A repeated parameter overwrites the earlier one.
 */

#include "src/input/inc/ParsedOptions.hpp"

#include <string>
#include <string_view>

namespace kcheck {

namespace input {

/**
 * @brief Normalize a cmdline parameter value.
 *
 * Boolean spellings ("on", "Y", "no", ...) collapse to "1" or "0" unless the
 * parameter is parsed by dedicated kernel code (mitigations, pti, tsx, ...),
 * in which case the value is kept verbatim.
 *
 * @param name  Parameter name.
 * @param value Raw value ("" for a bare flag).
 * @return Normalized value.
 */
[[nodiscard]] std::string normalizeCmdlineValue(std::string_view name, std::string_view value);

/**
 * @brief Parse cmdline text.
 * @param text   File contents.
 * @param origin File name used in error messages.
 * @param out    Receives parameters (cleared first).
 * @param error  Receives a message on failure.
 * @return true on success; false if a second non-empty line exists.
 */
[[nodiscard]] bool parseCmdlineText(std::string_view text, std::string_view origin,
                                    ParsedOptions& out, std::string& error) noexcept;

/**
 * @brief Read and parse a cmdline file.
 * @param path  File path.
 * @param out   Receives parameters (cleared first).
 * @param error Receives a message on failure.
 * @return true on success.
 */
[[nodiscard]] bool parseCmdlineFile(std::string_view path, ParsedOptions& out,
                                    std::string& error) noexcept;

} // namespace input

} // namespace kcheck

#endif // KCHECK_INPUT_CMDLINE_HPP
