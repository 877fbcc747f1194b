/**
 * @file Refine.cpp
 * @brief Implementation of post-population refinement.
 */

#include "src/engine/inc/Refine.hpp"

#include <string>

namespace kcheck {

namespace engine {

namespace {

std::size_t overrideNode(Check& check, std::string_view target, std::string_view value) {
  if (auto* leaf = std::get_if<LeafCheck>(&check.node)) {
    if (leaf->name != target) {
      return 0;
    }
    leaf->expected = std::string{value};
    return 1;
  }

  std::size_t changed = 0;
  auto& kids = std::holds_alternative<CombinatorCheck>(check.node)
                   ? std::get<CombinatorCheck>(check.node).children
                   : std::get<VersionGatedCheck>(check.node).branches;
  for (Check& kid : kids) {
    changed += overrideNode(kid, target, value);
  }
  return changed;
}

} // namespace

std::size_t overrideExpected(Checklist& checklist, std::string_view target,
                             std::string_view value) {
  std::size_t changed = 0;
  for (Check& check : checklist) {
    changed += overrideNode(check, target, value);
  }
  return changed;
}

std::size_t refine(Checklist& checklist, const input::ParsedOptions& kconfig,
                   std::span<const Refinement> refinements) {
  std::size_t changed = 0;
  for (const Refinement& R : refinements) {
    const std::string* value = kconfig.find(R.companion);
    if (value == nullptr || value->empty() || *value == input::OFF_MARKER) {
      continue;
    }
    changed += overrideExpected(checklist, R.target, *value);
  }
  return changed;
}

bool isRefinementTarget(std::string_view name, std::span<const Refinement> refinements) noexcept {
  for (const Refinement& R : refinements) {
    if (R.target == name) {
      return true;
    }
  }
  return false;
}

} // namespace engine

} // namespace kcheck
