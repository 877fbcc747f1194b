/**
 * @file Audit.cpp
 * @brief Command resolution and check pipeline implementation.
 */

#include "src/audit/inc/Audit.hpp"
#include "src/engine/inc/Evaluate.hpp"
#include "src/engine/inc/Populate.hpp"
#include "src/engine/inc/Refine.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/input/inc/Cmdline.hpp"
#include "src/input/inc/Kconfig.hpp"
#include "src/rules/inc/Checklist.hpp"

#include <utility>

#include <fmt/core.h>

namespace kcheck {

namespace audit {

using report::Mode;

/* ----------------------------- Request ----------------------------- */

bool resolveRequest(const Flags& flags, Request& out, std::string& error) {
  Request req;

  if (flags.mode) {
    const auto MODE = report::modeFromString(*flags.mode);
    if (!MODE) {
      error = fmt::format("invalid mode \"{}\" (choose from verbose, json, show_ok, show_fail)",
                          *flags.mode);
      return false;
    }
    req.mode = *MODE;
    req.modeGiven = true;
  }

  if (flags.config && flags.print) {
    error = "--config and --print can't be used together";
    return false;
  }
  if (flags.config && flags.generate) {
    error = "--config and --generate can't be used together";
    return false;
  }
  if (flags.print && flags.generate) {
    error = "--print and --generate can't be used together";
    return false;
  }
  if (!flags.config && flags.cmdline) {
    error = "checking cmdline depends on checking Kconfig";
    return false;
  }

  if (const auto TOKEN = flags.print ? flags.print : flags.generate) {
    const auto ARCH = input::archFromString(*TOKEN);
    if (!ARCH) {
      error = fmt::format(
          "invalid microarchitecture \"{}\" (choose from X86_64, X86_32, ARM64, ARM)", *TOKEN);
      return false;
    }
    req.arch = *ARCH;
  }

  if (flags.print && req.modeGiven && req.mode != Mode::VERBOSE && req.mode != Mode::JSON) {
    error = fmt::format("wrong mode \"{}\" for --print", *flags.mode);
    return false;
  }
  if (flags.generate && req.modeGiven) {
    error = fmt::format("wrong mode \"{}\" for --generate", *flags.mode);
    return false;
  }

  if (flags.config) {
    req.action = Action::CHECK;
    req.configPath = *flags.config;
    req.cmdlinePath = flags.cmdline;
  } else if (flags.print) {
    req.action = Action::PRINT;
  } else if (flags.generate) {
    req.action = Action::GENERATE;
  }

  out = req;
  return true;
}

/* ----------------------------- Pipeline ----------------------------- */

bool runAudit(std::string_view kconfigText, std::optional<input::ParsedOptions> cmdline,
              Audit& out, std::string& error) {
  if (!input::detectArch(kconfigText, out.arch, error)) {
    return false;
  }
  if (!input::detectKernelVersion(kconfigText, out.kernelVersion, error)) {
    return false;
  }
  // A missing compiler is only a note; contradictory markers are fatal
  if (!input::detectCompiler(kconfigText, out.compiler, out.compilerNote)) {
    error = out.compilerNote;
    return false;
  }

  out.checklist = rules::buildChecklist(out.arch, rules::RuleSelection{true, cmdline.has_value()});
  if (!engine::validate(out.checklist, error)) {
    return false;
  }

  if (!input::parseKconfigText(kconfigText, out.kconfig, error)) {
    return false;
  }
  engine::populate(out.checklist, out.kconfig, engine::DataSource::KCONFIG);
  engine::populate(out.checklist, out.kernelVersion);

  if (cmdline) {
    out.cmdline = std::move(*cmdline);
    engine::populate(out.checklist, out.cmdline, engine::DataSource::CMDLINE);
  }

  (void)engine::refine(out.checklist, out.kconfig);

  return engine::evaluate(out.checklist, error);
}

bool auditFiles(std::string_view configPath, std::optional<std::string_view> cmdlinePath,
                Audit& out, std::string& error) {
  std::string text;
  if (!helpers::files::readTextFile(configPath, text, error)) {
    return false;
  }

  std::optional<input::ParsedOptions> cmdline;
  if (cmdlinePath) {
    cmdline.emplace();
    if (!input::parseCmdlineFile(*cmdlinePath, *cmdline, error)) {
      return false;
    }
  }

  return runAudit(text, std::move(cmdline), out, error);
}

bool recommendations(input::Arch arch, engine::Checklist& out, std::string& error) {
  out = rules::buildChecklist(arch, rules::RuleSelection{true, true});
  return engine::validate(out, error);
}

} // namespace audit

} // namespace kcheck
