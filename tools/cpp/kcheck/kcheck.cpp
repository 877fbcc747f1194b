/**
 * @file kcheck.cpp
 * @brief Kernel security hardening configuration checker.
 *
 * Checks a Kconfig file (plain or gzip-compressed) and optionally a kernel
 * cmdline file against hardening recommendations, prints the
 * recommendations for a microarchitecture, or generates a Kconfig fragment.
 */

#include "src/audit/inc/Audit.hpp"
#include "src/engine/inc/Populate.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/input/inc/Detect.hpp"
#include "src/report/inc/Report.hpp"
#include "src/rules/inc/Checklist.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace engine = kcheck::engine;
namespace input = kcheck::input;
namespace report = kcheck::report;
namespace rules = kcheck::rules;

using kcheck::helpers::args::ArgMap;
using kcheck::helpers::args::ParsedArgs;
using report::Mode;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_VERSION = 1,
  ARG_MODE = 2,
  ARG_CONFIG = 3,
  ARG_CMDLINE = 4,
  ARG_PRINT = 5,
  ARG_GENERATE = 6,
};

constexpr std::string_view VERSION = "0.6.1";

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Check the security hardening options of the Linux kernel.\n"
    "Modes: verbose, json, show_ok, show_fail. Microarchitectures: X86_64, X86_32, ARM64, ARM.";

/// Build argument definitions.
ArgMap buildArgMap() {
  ArgMap map;
  map[ARG_HELP] = {"--help", "-h", 0, false, "Show this help message"};
  map[ARG_VERSION] = {"--version", "", 0, false, "Show program's version number"};
  map[ARG_MODE] = {"--mode", "-m", 1, false, "Choose the report mode"};
  map[ARG_CONFIG] = {"--config", "-c", 1, false,
                     "Check the kernel Kconfig file (also supports *.gz files)"};
  map[ARG_CMDLINE] = {"--cmdline", "-l", 1, false,
                      "Check the kernel cmdline file (contents of /proc/cmdline)"};
  map[ARG_PRINT] = {"--print", "-p", 1, false,
                    "Print the hardening recommendations for a microarchitecture"};
  map[ARG_GENERATE] = {"--generate", "-g", 1, false,
                       "Generate a Kconfig fragment with the hardening options"};
  return map;
}

/// Print a fatal error and return the process exit code.
int fatal(std::string_view msg) {
  fmt::print(stderr, "[!] ERROR: {}\n", msg);
  return 1;
}

/// Single value of a flag, or nullopt if the flag was not given.
std::optional<std::string_view> value(const ParsedArgs& pargs, ArgKey key) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return IT->second.front();
}

/* ----------------------------- Actions ----------------------------- */

int runCheck(const kcheck::audit::Request& req) {
  const bool QUIET = req.mode == Mode::JSON;
  if (!QUIET) {
    fmt::print("[+] Kconfig file to check: {}\n", req.configPath);
    if (req.cmdlinePath) {
      fmt::print("[+] Kernel cmdline file to check: {}\n", *req.cmdlinePath);
    }
  }

  kcheck::audit::Audit result;
  std::string error;
  if (!kcheck::audit::auditFiles(req.configPath, req.cmdlinePath, result, error)) {
    return fatal(error);
  }

  if (!QUIET) {
    fmt::print("[+] Detected microarchitecture: {}\n", input::toString(result.arch));
    fmt::print("[+] Detected kernel version: {}\n", result.kernelVersion.toString());
    if (result.compiler.detected()) {
      fmt::print("[+] Detected compiler: {}\n", result.compiler.toString());
    } else {
      fmt::print("[-] Can't detect the compiler: {}\n", result.compilerNote);
    }
  }

  if (req.mode == Mode::VERBOSE) {
    fmt::print("{}", report::formatUnknownOptions(
                         engine::collectUnknownOptions(result.checklist, result.kconfig)));
    fmt::print("{}", report::formatUnknownOptions(
                         engine::collectUnknownOptions(result.checklist, result.cmdline)));
  }

  fmt::print("{}", report::formatChecklist(result.checklist, req.mode, true));
  return 0;
}

int runPrint(const kcheck::audit::Request& req) {
  engine::Checklist checklist;
  std::string error;
  if (!kcheck::audit::recommendations(req.arch, checklist, error)) {
    return fatal(error);
  }
  if (req.mode != Mode::JSON) {
    fmt::print("[+] Printing kernel security hardening options for {}...\n",
               input::toString(req.arch));
  }
  fmt::print("{}", report::formatChecklist(checklist, req.mode, false));
  return 0;
}

int runGenerate(const kcheck::audit::Request& req) {
  const engine::Checklist CHECKLIST =
      rules::buildChecklist(req.arch, rules::RuleSelection{true, false});
  fmt::print("{}", report::formatFragment(req.arch, CHECKLIST));
  return 0;
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const ArgMap ARG_MAP = buildArgMap();

  if (argc <= 1) {
    kcheck::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  std::vector<std::string_view> args;
  args.reserve(static_cast<std::size_t>(argc - 1));
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  ParsedArgs pargs;
  std::string error;
  if (!kcheck::helpers::args::parseArgs(args, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "[!] ERROR: {}\n\n", error);
    kcheck::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  if (pargs.count(ARG_HELP) != 0) {
    kcheck::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }
  if (pargs.count(ARG_VERSION) != 0) {
    fmt::print("kcheck {}\n", VERSION);
    return 0;
  }

  kcheck::audit::Flags flags;
  flags.mode = value(pargs, ARG_MODE);
  flags.config = value(pargs, ARG_CONFIG);
  flags.cmdline = value(pargs, ARG_CMDLINE);
  flags.print = value(pargs, ARG_PRINT);
  flags.generate = value(pargs, ARG_GENERATE);

  // Reject bad invocations before doing any work
  kcheck::audit::Request req;
  if (!kcheck::audit::resolveRequest(flags, req, error)) {
    return fatal(error);
  }

  if (req.modeGiven && req.mode != Mode::JSON) {
    fmt::print("[+] Special report mode: {}\n", report::toString(req.mode));
  }

  switch (req.action) {
  case kcheck::audit::Action::CHECK:
    return runCheck(req);
  case kcheck::audit::Action::PRINT:
    return runPrint(req);
  case kcheck::audit::Action::GENERATE:
    return runGenerate(req);
  case kcheck::audit::Action::NONE:
    break;
  }

  kcheck::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
  return 0;
}
