/**
 * @file Populate.cpp
 * @brief Implementation of the population phase.
 */

#include "src/engine/inc/Populate.hpp"

#include <set>
#include <string>

namespace kcheck {

namespace engine {

namespace {

/// Visit every node of a check tree, including both version branches.
template <typename Visitor> void walk(Check& check, Visitor& visit) {
  visit(check);
  if (auto* comb = std::get_if<CombinatorCheck>(&check.node)) {
    for (Check& kid : comb->children) {
      walk(kid, visit);
    }
  } else if (auto* gate = std::get_if<VersionGatedCheck>(&check.node)) {
    for (Check& branch : gate->branches) {
      walk(branch, visit);
    }
  }
}

} // namespace

void populate(Checklist& checklist, const input::ParsedOptions& options, DataSource source) {
  auto attach = [&options, source](Check& check) {
    auto* leaf = std::get_if<LeafCheck>(&check.node);
    if (leaf == nullptr || leaf->source != source) {
      return;
    }
    const std::string* value = options.find(leaf->name);
    if (value != nullptr) {
      leaf->found = *value;
    } else {
      leaf->found.reset();
    }
  };

  for (Check& check : checklist) {
    walk(check, attach);
  }
}

void populate(Checklist& checklist, const input::KernelVersion& version) noexcept {
  auto attach = [&version](Check& check) {
    if (auto* leaf = std::get_if<LeafCheck>(&check.node)) {
      if (leaf->source == DataSource::VERSION) {
        leaf->kernelVersion = version;
      }
    } else if (auto* gate = std::get_if<VersionGatedCheck>(&check.node)) {
      gate->kernelVersion = version;
    }
  };

  for (Check& check : checklist) {
    walk(check, attach);
  }
}

std::vector<input::ParsedOption> collectUnknownOptions(const Checklist& checklist,
                                                       const input::ParsedOptions& options) {
  std::set<std::string, std::less<>> known;
  for (const Check& CHECK : checklist) {
    collectLeafNames(CHECK, known);
  }

  std::vector<input::ParsedOption> unknown;
  for (const input::ParsedOption& OPT : options) {
    if (known.find(OPT.name) == known.end()) {
      unknown.push_back(OPT);
    }
  }
  return unknown;
}

} // namespace engine

} // namespace kcheck
