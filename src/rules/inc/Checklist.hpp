#ifndef KCHECK_RULES_CHECKLIST_HPP
#define KCHECK_RULES_CHECKLIST_HPP
/**
 * @file Checklist.hpp
 * @brief Hardening rule database.
 *
 * Recommendations follow KSPP, grsecurity, CLIP OS, kernel maintainers,
 * lockdown LSM coverage and defconfig defaults. Each call builds a fresh,
 * unpopulated checklist; nothing is shared between runs.
 *
 * Kconfig rules never contain cmdline leaves, so a Kconfig-only check does
 * not report cmdline parameters as UNKNOWN.
 */

#include "src/engine/inc/Check.hpp"
#include "src/input/inc/Detect.hpp"

namespace kcheck {

namespace rules {

/**
 * @brief Which rule groups to include.
 */
struct RuleSelection {
  bool kconfig{true};  ///< Kconfig rules
  bool cmdline{false}; ///< Kernel boot parameter rules (may nest Kconfig leaves)
};

/// @brief Append the Kconfig rules for @p arch.
void addKconfigChecks(engine::Checklist& checklist, input::Arch arch);

/// @brief Append the cmdline rules for @p arch.
void addCmdlineChecks(engine::Checklist& checklist, input::Arch arch);

/**
 * @brief Build the checklist for one microarchitecture.
 * @param arch      Target microarchitecture.
 * @param selection Rule groups to include (Kconfig first, then cmdline).
 * @return Ordered top-level checks.
 */
[[nodiscard]] engine::Checklist buildChecklist(input::Arch arch, RuleSelection selection);

} // namespace rules

} // namespace kcheck

#endif // KCHECK_RULES_CHECKLIST_HPP
