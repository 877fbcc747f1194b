/**
 * @file Check.cpp
 * @brief Check model construction and tree queries.
 */

#include "src/engine/inc/Check.hpp"
#include "src/input/inc/ParsedOptions.hpp"

#include <utility>

#include <fmt/core.h>

namespace kcheck {

namespace engine {

namespace {

constexpr std::string_view NOT_OFF_TOKEN = "is not off";
constexpr std::string_view PRESENT_TOKEN = "is present";
constexpr std::string_view VERSION_LEAF_NAME = "kernel version";

/// Returned for malformed trees that have no primary leaf.
const LeafCheck EMPTY_LEAF{};

bool validateNode(const Check& check, std::string& error) {
  if (const auto* comb = std::get_if<CombinatorCheck>(&check.node)) {
    if (comb->children.empty()) {
      error = fmt::format("{} check without children", toString(comb->op));
      return false;
    }
    for (const Check& CHILD : comb->children) {
      if (!validateNode(CHILD, error)) {
        return false;
      }
    }
  } else if (const auto* gate = std::get_if<VersionGatedCheck>(&check.node)) {
    if (gate->branches.size() != 2) {
      error = fmt::format("version check for {} needs exactly two branches",
                          gate->threshold.toString());
      return false;
    }
    for (const Check& BRANCH : gate->branches) {
      if (!validateNode(BRANCH, error)) {
        return false;
      }
    }
  }
  return true;
}

} // namespace

/* ----------------------------- Enum toString ----------------------------- */

const char* toString(DataSource source) noexcept {
  switch (source) {
  case DataSource::KCONFIG:
    return "kconfig";
  case DataSource::CMDLINE:
    return "cmdline";
  case DataSource::VERSION:
    return "version";
  }
  return "unknown";
}

const char* toString(Verdict verdict) noexcept {
  switch (verdict) {
  case Verdict::OK:
    return "OK";
  case Verdict::FAIL:
    return "FAIL";
  case Verdict::UNKNOWN:
    return "UNKNOWN";
  }
  return "UNKNOWN";
}

const char* toString(Combinator op) noexcept {
  switch (op) {
  case Combinator::AND:
    return "AND";
  case Combinator::OR:
    return "OR";
  }
  return "unknown";
}

/* ----------------------------- Methods ----------------------------- */

std::string EvaluationResult::toString() const {
  return fmt::format("{}: {}", engine::toString(verdict), reason);
}

std::string LeafCheck::expectedText() const {
  switch (comparison) {
  case Comparison::EQUALS:
    return expected;
  case Comparison::NOT_OFF:
    return std::string{NOT_OFF_TOKEN};
  case Comparison::NOT_SET:
    return std::string{input::OFF_MARKER};
  case Comparison::PRESENT:
    return std::string{PRESENT_TOKEN};
  case Comparison::AT_LEAST:
    return ">= " + expected;
  case Comparison::AT_MOST:
    return "<= " + expected;
  }
  return expected;
}

/* ----------------------------- Construction ----------------------------- */

Check makeLeaf(DataSource source, Tag tag, std::string name, std::string_view expected) {
  LeafCheck leaf;
  leaf.tag = std::move(tag);
  leaf.name = std::move(name);
  leaf.source = source;

  if (expected == input::OFF_MARKER) {
    leaf.comparison = Comparison::NOT_SET;
  } else if (expected == NOT_OFF_TOKEN) {
    leaf.comparison = Comparison::NOT_OFF;
  } else if (expected == PRESENT_TOKEN) {
    leaf.comparison = Comparison::PRESENT;
  } else {
    leaf.comparison = Comparison::EQUALS;
    leaf.expected = std::string{expected};
  }

  return Check{std::move(leaf), std::nullopt};
}

Check makeThreshold(DataSource source, Tag tag, std::string name, Comparison comparison,
                    std::string threshold) {
  LeafCheck leaf;
  leaf.tag = std::move(tag);
  leaf.name = std::move(name);
  leaf.source = source;
  leaf.comparison = comparison;
  leaf.expected = std::move(threshold);
  return Check{std::move(leaf), std::nullopt};
}

Check makeVersion(input::KernelVersion threshold) {
  LeafCheck leaf;
  leaf.name = std::string{VERSION_LEAF_NAME};
  leaf.source = DataSource::VERSION;
  leaf.comparison = Comparison::AT_LEAST;
  leaf.expected = threshold.toString();
  return Check{std::move(leaf), std::nullopt};
}

Check makeCombinator(Combinator op, std::vector<Check> children) {
  return Check{CombinatorCheck{op, std::move(children)}, std::nullopt};
}

Check makeVersionGated(input::KernelVersion threshold, Check before, Check after) {
  VersionGatedCheck gate;
  gate.threshold = threshold;
  gate.branches.reserve(2);
  gate.branches.push_back(std::move(before));
  gate.branches.push_back(std::move(after));
  return Check{std::move(gate), std::nullopt};
}

/* ----------------------------- Queries ----------------------------- */

const LeafCheck& primaryLeaf(const Check& check) noexcept {
  if (const auto* leaf = std::get_if<LeafCheck>(&check.node)) {
    return *leaf;
  }
  if (const auto* comb = std::get_if<CombinatorCheck>(&check.node)) {
    return comb->children.empty() ? EMPTY_LEAF : primaryLeaf(comb->children.front());
  }
  const auto& GATE = std::get<VersionGatedCheck>(check.node);
  return GATE.branches.size() <= VersionGatedCheck::AFTER
             ? EMPTY_LEAF
             : primaryLeaf(GATE.branches[VersionGatedCheck::AFTER]);
}

void collectLeafNames(const Check& check, std::set<std::string, std::less<>>& names) {
  if (const auto* leaf = std::get_if<LeafCheck>(&check.node)) {
    if (leaf->source != DataSource::VERSION) {
      names.insert(leaf->name);
    }
    return;
  }
  const std::vector<Check>& kids = std::holds_alternative<CombinatorCheck>(check.node)
                                       ? std::get<CombinatorCheck>(check.node).children
                                       : std::get<VersionGatedCheck>(check.node).branches;
  for (const Check& KID : kids) {
    collectLeafNames(KID, names);
  }
}

bool validate(const Checklist& checklist, std::string& error) {
  for (const Check& CHECK : checklist) {
    bool ok = validateNode(CHECK, error);
    // Nested version leaves are fine; a top-level check must name an option
    if (ok && primaryLeaf(CHECK).source == DataSource::VERSION) {
      error = "a check can't be about the kernel version alone";
      ok = false;
    }
    if (!ok) {
      const LeafCheck& PRIMARY = primaryLeaf(CHECK);
      error = fmt::format("malformed check {}: {}",
                          PRIMARY.name.empty() ? "<unnamed>" : PRIMARY.name, error);
      return false;
    }
  }
  return true;
}

void clearResults(Check& check) noexcept {
  check.result.reset();
  if (auto* comb = std::get_if<CombinatorCheck>(&check.node)) {
    for (Check& kid : comb->children) {
      clearResults(kid);
    }
  } else if (auto* gate = std::get_if<VersionGatedCheck>(&check.node)) {
    for (Check& branch : gate->branches) {
      clearResults(branch);
    }
  }
}

} // namespace engine

} // namespace kcheck
