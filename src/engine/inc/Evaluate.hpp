#ifndef KCHECK_ENGINE_EVALUATE_HPP
#define KCHECK_ENGINE_EVALUATE_HPP
/**
 * @file Evaluate.hpp
 * @brief Verdict computation over populated check trees.
 *
 * Semantics:
 *  - Leaf: UNKNOWN when the option is absent (except NOT_SET and PRESENT),
 *    otherwise OK/FAIL by the leaf's comparison.
 *  - AND: first FAIL child wins; else UNKNOWN if any child is UNKNOWN; else OK.
 *  - OR:  first OK child wins; else UNKNOWN if any child is UNKNOWN; else FAIL.
 *  - Version gate: only the selected branch is evaluated; its result is
 *    adopted as-is.
 *
 * Children after a short-circuit and the unselected version branch keep an
 * empty result.
 */

#include "src/engine/inc/Check.hpp"

#include <string>

namespace kcheck {

namespace engine {

/**
 * @brief Evaluate one check tree from scratch.
 * @param check Populated check.
 * @param error Receives a message for non-numeric threshold operands or a
 *              malformed version threshold.
 * @return false on a fatal inconsistency (result left incomplete).
 */
[[nodiscard]] bool evaluate(Check& check, std::string& error);

/**
 * @brief Evaluate every top-level check in order.
 * @return false on the first fatal inconsistency.
 */
[[nodiscard]] bool evaluate(Checklist& checklist, std::string& error);

} // namespace engine

} // namespace kcheck

#endif // KCHECK_ENGINE_EVALUATE_HPP
