#ifndef KCHECK_ENGINE_POPULATE_HPP
#define KCHECK_ENGINE_POPULATE_HPP
/**
 * @file Populate.hpp
 * @brief Attach parsed data to check trees.
 *
 * Population produces no verdicts. It records, for every leaf, the raw value
 * found in the data source the leaf declares (or nothing if absent).
 */

#include "src/engine/inc/Check.hpp"
#include "src/input/inc/KernelVersion.hpp"
#include "src/input/inc/ParsedOptions.hpp"

#include <vector>

namespace kcheck {

namespace engine {

/**
 * @brief Attach option values to every leaf reading from @p source.
 * @param checklist Checks to populate (recursively, both version branches).
 * @param options   Parsed options of one data source.
 * @param source    Data source the options came from (KCONFIG or CMDLINE).
 */
void populate(Checklist& checklist, const input::ParsedOptions& options, DataSource source);

/**
 * @brief Attach the detected kernel version to every version leaf and
 *        every version-gated check.
 */
void populate(Checklist& checklist, const input::KernelVersion& version) noexcept;

/**
 * @brief Parsed options that no leaf in the checklist refers to.
 * @return Options in parse order.
 */
[[nodiscard]] std::vector<input::ParsedOption>
collectUnknownOptions(const Checklist& checklist, const input::ParsedOptions& options);

} // namespace engine

} // namespace kcheck

#endif // KCHECK_ENGINE_POPULATE_HPP
