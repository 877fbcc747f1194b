/**
 * @file Report.cpp
 * @brief Implementation of table, JSON and fragment rendering.
 */

#include "src/report/inc/Report.hpp"
#include "src/engine/inc/Refine.hpp"
#include "src/helpers/inc/Format.hpp"

#include <initializer_list>
#include <set>

#include <fmt/core.h>

namespace kcheck {

namespace report {

namespace {

using engine::Check;
using engine::Checklist;
using engine::CombinatorCheck;
using engine::Comparison;
using engine::DataSource;
using engine::LeafCheck;
using engine::Verdict;
using engine::VersionGatedCheck;
using helpers::format::jsonString;

/// Width of the composite header cell in verbose mode (after 4 spaces of indent).
constexpr std::size_t COMPOSITE_WIDTH = 87;

/* ----------------------------- Table ----------------------------- */

std::string leafColumns(const LeafCheck& leaf) {
  if (leaf.source == DataSource::VERSION) {
    return fmt::format("{:<91}", "kernel version >= " + leaf.expected);
  }
  return fmt::format("{:<40}|{:^7}|{:^12}|{:^10}|{:^18}", leaf.name, engine::toString(leaf.source),
                     leaf.expectedText(), leaf.tag.decision, leaf.tag.reason);
}

std::string resultColumn(const Check& check, bool withResults) {
  if (!withResults || !check.result) {
    return {};
  }
  return "| " + check.result->toString();
}

std::string compositeHeader(const Check& check) {
  if (const auto* comb = std::get_if<CombinatorCheck>(&check.node)) {
    return fmt::format("<<< {} >>>", engine::toString(comb->op));
  }
  return fmt::format("<<< VERSION >= {} >>>",
                     std::get<VersionGatedCheck>(check.node).threshold.toString());
}

/// Children shown under a composite: all of them before evaluation, only
/// evaluated ones afterwards.
std::vector<const Check*> shownChildren(const Check& check, bool withResults) {
  const std::vector<Check>& kids = std::holds_alternative<CombinatorCheck>(check.node)
                                       ? std::get<CombinatorCheck>(check.node).children
                                       : std::get<VersionGatedCheck>(check.node).branches;
  std::vector<const Check*> shown;
  for (const Check& KID : kids) {
    if (!withResults || KID.result) {
      shown.push_back(&KID);
    }
  }
  return shown;
}

void appendVerboseRow(std::string& out, const Check& check, bool withResults) {
  if (const auto* leaf = std::get_if<LeafCheck>(&check.node)) {
    out += leafColumns(*leaf);
    out += resultColumn(check, withResults);
    return;
  }

  out += fmt::format("    {:<{}}", compositeHeader(check), COMPOSITE_WIDTH);
  out += resultColumn(check, withResults);
  for (const Check* kid : shownChildren(check, withResults)) {
    out += '\n';
    appendVerboseRow(out, *kid, withResults);
  }
}

bool passesFilter(const Check& check, Mode mode) noexcept {
  if (mode == Mode::SHOW_OK) {
    return check.result && check.result->verdict == Verdict::OK;
  }
  if (mode == Mode::SHOW_FAIL) {
    return check.result && check.result->verdict == Verdict::FAIL;
  }
  return true;
}

/* ----------------------------- JSON ----------------------------- */

std::string jsonObject(const Check& check, bool withResults) {
  const LeafCheck& LEAF = engine::primaryLeaf(check);
  std::string out = "{";
  if (check.isLeaf() && LEAF.source == DataSource::VERSION) {
    out += fmt::format("\"option_name\": {}, \"type\": {}, \"desired_val\": {}, "
                       "\"decision\": \"\", \"reason\": \"\"",
                       jsonString(LEAF.name), jsonString(engine::toString(LEAF.source)),
                       jsonString(LEAF.expectedText()));
  } else {
    out += fmt::format("\"option_name\": {}, \"type\": {}, \"desired_val\": {}, "
                       "\"decision\": {}, \"reason\": {}",
                       jsonString(LEAF.name), jsonString(engine::toString(LEAF.source)),
                       jsonString(LEAF.expectedText()), jsonString(LEAF.tag.decision),
                       jsonString(LEAF.tag.reason));
  }

  if (withResults && check.result) {
    out += fmt::format(", \"check_result\": {}, \"verdict\": {}",
                       jsonString(check.result->toString()),
                       jsonString(engine::toString(check.result->verdict)));
  }

  if (!check.isLeaf()) {
    const char* kind = "VERSION";
    if (const auto* comb = std::get_if<CombinatorCheck>(&check.node)) {
      kind = engine::toString(comb->op);
    }
    out += fmt::format(", \"kind\": {}, \"children\": [", jsonString(kind));
    bool first = true;
    for (const Check* kid : shownChildren(check, withResults)) {
      if (!first) {
        out += ", ";
      }
      out += jsonObject(*kid, withResults);
      first = false;
    }
    out += "]";
  }

  out += "}";
  return out;
}

} // namespace

/* ----------------------------- Mode ----------------------------- */

const char* toString(Mode mode) noexcept {
  switch (mode) {
  case Mode::DEFAULT:
    return "default";
  case Mode::VERBOSE:
    return "verbose";
  case Mode::JSON:
    return "json";
  case Mode::SHOW_OK:
    return "show_ok";
  case Mode::SHOW_FAIL:
    return "show_fail";
  }
  return "unknown";
}

std::optional<Mode> modeFromString(std::string_view token) noexcept {
  for (const Mode M : {Mode::VERBOSE, Mode::JSON, Mode::SHOW_OK, Mode::SHOW_FAIL}) {
    if (token == toString(M)) {
      return M;
    }
  }
  return std::nullopt;
}

/* ----------------------------- Tally ----------------------------- */

Tally tally(const Checklist& checklist) noexcept {
  Tally t{};
  for (const Check& CHECK : checklist) {
    if (!CHECK.result) {
      continue;
    }
    switch (CHECK.result->verdict) {
    case Verdict::OK:
      ++t.ok;
      break;
    case Verdict::FAIL:
      ++t.fail;
      break;
    case Verdict::UNKNOWN:
      ++t.unknown;
      break;
    }
  }
  return t;
}

/* ----------------------------- Rendering ----------------------------- */

std::string formatTable(const Checklist& checklist, Mode mode, bool withResults) {
  const std::size_t WIDTH = TABLE_WIDTH + (withResults ? RESULT_WIDTH : 0);
  const std::string SEP(WIDTH, '=');

  std::string out;
  out += SEP + "\n";
  out += fmt::format("{:^40}|{:^7}|{:^12}|{:^10}|{:^18}", "option name", "type", "desired val",
                     "decision", "reason");
  if (withResults) {
    out += "| check result";
  }
  out += "\n" + SEP + "\n";

  for (const Check& CHECK : checklist) {
    if (withResults && !passesFilter(CHECK, mode)) {
      continue;
    }
    if (mode == Mode::VERBOSE) {
      appendVerboseRow(out, CHECK, withResults);
    } else {
      out += leafColumns(engine::primaryLeaf(CHECK));
      out += resultColumn(CHECK, withResults);
    }
    out += "\n";
    if (mode == Mode::VERBOSE) {
      out += std::string(WIDTH, '-') + "\n";
    }
  }
  out += "\n";

  if (withResults) {
    const Tally T = tally(checklist);
    out += fmt::format("[+] Config check is finished: 'OK' - {}{} / 'FAIL' - {}{}\n", T.ok,
                       mode == Mode::SHOW_FAIL ? " (suppressed in output)" : "", T.fail,
                       mode == Mode::SHOW_OK ? " (suppressed in output)" : "");
  }
  return out;
}

std::string formatJson(const Checklist& checklist, bool withResults) {
  std::string out = "[";
  bool first = true;
  for (const Check& CHECK : checklist) {
    if (!first) {
      out += ", ";
    }
    out += jsonObject(CHECK, withResults);
    first = false;
  }
  out += "]";
  return out;
}

std::string formatChecklist(const Checklist& checklist, Mode mode, bool withResults) {
  if (mode == Mode::JSON) {
    return formatJson(checklist, withResults) + "\n";
  }
  return formatTable(checklist, mode, withResults);
}

std::string formatFragment(input::Arch arch, const Checklist& checklist) {
  std::string out = fmt::format("CONFIG_{}=y\n", input::toString(arch));
  std::set<std::string, std::less<>> emitted;

  for (const Check& CHECK : checklist) {
    const LeafCheck& LEAF = engine::primaryLeaf(CHECK);
    if (LEAF.source != DataSource::KCONFIG || engine::isRefinementTarget(LEAF.name)) {
      continue;
    }
    if (LEAF.comparison == Comparison::NOT_OFF || LEAF.comparison == Comparison::PRESENT) {
      continue;
    }
    if (!emitted.insert(LEAF.name).second) {
      continue;
    }
    if (LEAF.comparison == Comparison::NOT_SET) {
      out += fmt::format("# {} is not set\n", LEAF.name);
    } else {
      out += fmt::format("{}={}\n", LEAF.name, LEAF.expected);
    }
  }
  return out;
}

std::string formatUnknownOptions(const std::vector<input::ParsedOption>& options) {
  std::string out;
  for (const input::ParsedOption& OPT : options) {
    out += fmt::format("[?] No check for option {} ({})\n", OPT.name, OPT.value);
  }
  return out;
}

} // namespace report

} // namespace kcheck
