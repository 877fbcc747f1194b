/**
 * @file Evaluate.cpp
 * @brief Implementation of leaf comparisons and combinator semantics.
 */

#include "src/engine/inc/Evaluate.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/input/inc/ParsedOptions.hpp"

#include <array>
#include <algorithm>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace kcheck {

namespace engine {

namespace {

using kcheck::helpers::strings::parseInt;
using kcheck::helpers::strings::unquote;

/// Values NOT_OFF treats as disabled.
constexpr std::array<std::string_view, 3> OFF_VALUES = {input::OFF_MARKER, "off", "0"};

bool isOff(std::string_view value) noexcept {
  return std::find(OFF_VALUES.begin(), OFF_VALUES.end(), value) != OFF_VALUES.end();
}

EvaluationResult make(Verdict verdict, std::string reason, std::optional<std::string> found) {
  return EvaluationResult{verdict, std::move(reason), std::move(found)};
}

bool evaluateVersionLeaf(const LeafCheck& leaf, EvaluationResult& out, std::string& error) {
  if (!leaf.kernelVersion) {
    out = make(Verdict::UNKNOWN, "kernel version is not found", std::nullopt);
    return true;
  }

  const auto THRESHOLD = input::parseKernelVersion(leaf.expected);
  if (!THRESHOLD) {
    error = fmt::format("bad kernel version threshold \"{}\"", leaf.expected);
    return false;
  }

  const std::string V = leaf.kernelVersion->toString();
  if (*leaf.kernelVersion >= *THRESHOLD) {
    out = make(Verdict::OK, fmt::format("kernel version {} >= {}", V, leaf.expected), V);
  } else {
    out = make(Verdict::FAIL, fmt::format("kernel version {} < {}", V, leaf.expected), V);
  }
  return true;
}

bool evaluateThreshold(const LeafCheck& leaf, EvaluationResult& out, std::string& error) {
  const std::string& FOUND = *leaf.found;
  const auto HAVE = parseInt(unquote(FOUND));
  const auto WANT = parseInt(unquote(leaf.expected));
  if (!HAVE || !WANT) {
    error = fmt::format("non-numeric value in check of {}: \"{}\" vs \"{}\"", leaf.name, FOUND,
                        leaf.expected);
    return false;
  }

  const bool AT_LEAST = leaf.comparison == Comparison::AT_LEAST;
  const bool PASS = AT_LEAST ? *HAVE >= *WANT : *HAVE <= *WANT;
  out = make(PASS ? Verdict::OK : Verdict::FAIL,
             fmt::format("{} is {}, expected {} {}", leaf.name, FOUND, AT_LEAST ? ">=" : "<=",
                         leaf.expected),
             FOUND);
  return true;
}

bool evaluateLeaf(const LeafCheck& leaf, EvaluationResult& out, std::string& error) {
  if (leaf.source == DataSource::VERSION) {
    return evaluateVersionLeaf(leaf, out, error);
  }

  if (leaf.comparison == Comparison::PRESENT) {
    out = leaf.found ? make(Verdict::OK, fmt::format("{} is present", leaf.name), leaf.found)
                     : make(Verdict::FAIL, fmt::format("{} is not present", leaf.name),
                            std::nullopt);
    return true;
  }

  if (!leaf.found) {
    const Verdict V = leaf.comparison == Comparison::NOT_SET ? Verdict::OK : Verdict::UNKNOWN;
    out = make(V, fmt::format("{} is not found", leaf.name), std::nullopt);
    return true;
  }

  const std::string& FOUND = *leaf.found;
  switch (leaf.comparison) {
  case Comparison::EQUALS:
    if (unquote(FOUND) == unquote(leaf.expected)) {
      out = make(Verdict::OK, fmt::format("{} is \"{}\"", leaf.name, FOUND), FOUND);
    } else if (FOUND == input::OFF_MARKER) {
      out = make(Verdict::FAIL,
                 fmt::format("{} is not set, expected \"{}\"", leaf.name, leaf.expected), FOUND);
    } else {
      out = make(Verdict::FAIL,
                 fmt::format("{} is \"{}\", expected \"{}\"", leaf.name, FOUND, leaf.expected),
                 FOUND);
    }
    return true;

  case Comparison::NOT_OFF:
    if (!isOff(FOUND)) {
      out = make(Verdict::OK, fmt::format("{} is not off, \"{}\"", leaf.name, FOUND), FOUND);
    } else if (FOUND == input::OFF_MARKER) {
      out = make(Verdict::FAIL, fmt::format("{} is off, not set", leaf.name), FOUND);
    } else {
      out = make(Verdict::FAIL, fmt::format("{} is off, \"{}\"", leaf.name, FOUND), FOUND);
    }
    return true;

  case Comparison::NOT_SET:
    if (FOUND == input::OFF_MARKER) {
      out = make(Verdict::OK, fmt::format("{} is not set", leaf.name), FOUND);
    } else {
      out = make(Verdict::FAIL, fmt::format("{} is \"{}\", expected not set", leaf.name, FOUND),
                 FOUND);
    }
    return true;

  case Comparison::AT_LEAST:
  case Comparison::AT_MOST:
    return evaluateThreshold(leaf, out, error);

  case Comparison::PRESENT:
    break;
  }
  return true;
}

bool evaluateCombinator(CombinatorCheck& comb, EvaluationResult& out, std::string& error) {
  const Verdict STOP = comb.op == Combinator::AND ? Verdict::FAIL : Verdict::OK;
  const EvaluationResult* firstUnknown = nullptr;
  std::vector<std::string> failReasons;

  for (Check& kid : comb.children) {
    if (!evaluate(kid, error)) {
      return false;
    }
    const EvaluationResult& R = *kid.result;
    if (R.verdict == STOP) {
      out = R;
      return true;
    }
    if (R.verdict == Verdict::UNKNOWN) {
      if (firstUnknown == nullptr) {
        firstUnknown = &R;
      }
    } else if (R.verdict == Verdict::FAIL) {
      failReasons.push_back(R.reason);
    }
  }

  if (firstUnknown != nullptr) {
    out = *firstUnknown;
    return true;
  }

  if (comb.op == Combinator::AND) {
    out = *comb.children.front().result;
    return true;
  }

  out = make(Verdict::FAIL,
             "no alternative holds: " + helpers::format::join(failReasons, "; "), std::nullopt);
  return true;
}

bool evaluateVersionGated(VersionGatedCheck& gate, EvaluationResult& out, std::string& error) {
  if (!gate.kernelVersion) {
    out = make(Verdict::UNKNOWN, "kernel version is not found", std::nullopt);
    return true;
  }

  const std::size_t PICK = *gate.kernelVersion < gate.threshold ? VersionGatedCheck::BEFORE
                                                                  : VersionGatedCheck::AFTER;
  Check& branch = gate.branches[PICK];
  if (!evaluate(branch, error)) {
    return false;
  }
  out = *branch.result;
  return true;
}

} // namespace

bool evaluate(Check& check, std::string& error) {
  clearResults(check);

  EvaluationResult result;
  bool ok = true;
  if (auto* leaf = std::get_if<LeafCheck>(&check.node)) {
    ok = evaluateLeaf(*leaf, result, error);
  } else if (auto* comb = std::get_if<CombinatorCheck>(&check.node)) {
    ok = evaluateCombinator(*comb, result, error);
  } else {
    ok = evaluateVersionGated(std::get<VersionGatedCheck>(check.node), result, error);
  }

  if (ok) {
    check.result = std::move(result);
  }
  return ok;
}

bool evaluate(Checklist& checklist, std::string& error) {
  for (Check& check : checklist) {
    if (!evaluate(check, error)) {
      return false;
    }
  }
  return true;
}

} // namespace engine

} // namespace kcheck
