#ifndef KCHECK_ENGINE_REFINE_HPP
#define KCHECK_ENGINE_REFINE_HPP
/**
 * @file Refine.hpp
 * @brief Post-population refinement of expected values.
 *
 * Some thresholds are only knowable from the data being checked. A
 * Refinement names a target leaf and a companion Kconfig option; when the
 * companion is present and enabled, every leaf named target takes the
 * companion's value as its expected value. Refinement runs exactly once,
 * after population and before evaluation.
 */

#include "src/engine/inc/Check.hpp"
#include "src/input/inc/ParsedOptions.hpp"

#include <array>
#include <cstddef>
#include <span>
#include <string_view>

namespace kcheck {

namespace engine {

/**
 * @brief One named refinement hook.
 */
struct Refinement {
  std::string_view name;      ///< Short label used in diagnostics
  std::string_view target;    ///< Leaf name whose expected value is rewritten
  std::string_view companion; ///< Kconfig option supplying the new value
};

/// Built-in refinements.
inline constexpr std::array<Refinement, 1> DEFAULT_REFINEMENTS = {{
    {"mmap_rnd_bits_max", "CONFIG_ARCH_MMAP_RND_BITS", "CONFIG_ARCH_MMAP_RND_BITS_MAX"},
}};

/**
 * @brief Set expected = value on every leaf named @p target (recursively).
 * @return Number of leaves changed.
 */
std::size_t overrideExpected(Checklist& checklist, std::string_view target,
                             std::string_view value);

/**
 * @brief Apply refinements using Kconfig data.
 * @param checklist   Populated checklist.
 * @param kconfig     Parsed Kconfig options.
 * @param refinements Hooks to apply, in order.
 * @return Number of leaves changed.
 */
std::size_t refine(Checklist& checklist, const input::ParsedOptions& kconfig,
                   std::span<const Refinement> refinements = DEFAULT_REFINEMENTS);

/// @brief True if @p name is the target of any of @p refinements.
[[nodiscard]] bool
isRefinementTarget(std::string_view name,
                   std::span<const Refinement> refinements = DEFAULT_REFINEMENTS) noexcept;

} // namespace engine

} // namespace kcheck

#endif // KCHECK_ENGINE_REFINE_HPP
