#ifndef KCHECK_AUDIT_AUDIT_HPP
#define KCHECK_AUDIT_AUDIT_HPP
/**
 * @file Audit.hpp
 * @brief Command resolution and the end-to-end check pipeline.
 *
 * The kcheck CLI is a thin shell over these functions: it parses flags,
 * resolves them into a Request, runs the selected action and prints the
 * outcome. Nothing here writes to stdout or stderr.
 */

#include "src/engine/inc/Check.hpp"
#include "src/input/inc/Detect.hpp"
#include "src/input/inc/KernelVersion.hpp"
#include "src/input/inc/ParsedOptions.hpp"
#include "src/report/inc/Report.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kcheck {

namespace audit {

/* ----------------------------- Request ----------------------------- */

/**
 * @brief Top-level action selected on the command line.
 */
enum class Action : std::uint8_t {
  NONE = 0, ///< Nothing to do (print usage)
  CHECK,    ///< Check a Kconfig file, optionally with a cmdline file
  PRINT,    ///< Print the recommendations for an architecture
  GENERATE, ///< Print a Kconfig fragment for an architecture
};

/**
 * @brief Flag values as given on the command line (nullopt if absent).
 */
struct Flags {
  std::optional<std::string_view> mode;
  std::optional<std::string_view> config;
  std::optional<std::string_view> cmdline;
  std::optional<std::string_view> print;
  std::optional<std::string_view> generate;
};

/**
 * @brief Validated invocation.
 */
struct Request {
  Action action{Action::NONE};
  report::Mode mode{report::Mode::DEFAULT};
  bool modeGiven{false};                      ///< --mode was passed explicitly
  std::string_view configPath{};              ///< CHECK only
  std::optional<std::string_view> cmdlinePath; ///< CHECK only
  input::Arch arch{input::Arch::X86_64};      ///< PRINT and GENERATE only
};

/**
 * @brief Turn raw flags into a Request, rejecting invalid combinations.
 *
 * Rejected: unknown mode or architecture token; --config with --print or
 * --generate; --print with --generate; --cmdline without --config; --print
 * with a mode other than verbose or json; --generate with any mode.
 *
 * @param flags Raw flag values.
 * @param out   Receives the request on success.
 * @param error Receives a message on failure.
 * @return true if the invocation is valid.
 */
[[nodiscard]] bool resolveRequest(const Flags& flags, Request& out, std::string& error);

/* ----------------------------- Pipeline ----------------------------- */

/**
 * @brief Everything one check run produces.
 */
struct Audit {
  input::Arch arch{input::Arch::X86_64};
  input::KernelVersion kernelVersion{};
  input::CompilerInfo compiler;
  std::string compilerNote; ///< Why the compiler is unknown, if it is
  input::ParsedOptions kconfig;
  input::ParsedOptions cmdline;
  engine::Checklist checklist; ///< Populated, refined and evaluated
};

/**
 * @brief Run the check pipeline on Kconfig text and optional parsed cmdline.
 *
 * Order: detect arch, kernel version and compiler; build and validate the
 * checklist (cmdline rules only when @p cmdline is given); parse Kconfig;
 * populate; refine; evaluate.
 *
 * @param kconfigText Kconfig file contents.
 * @param cmdline     Parsed cmdline parameters, or nullopt.
 * @param out         Receives the results (partially filled on failure).
 * @param error       Receives the first fatal error.
 * @return true on success.
 */
[[nodiscard]] bool runAudit(std::string_view kconfigText,
                            std::optional<input::ParsedOptions> cmdline, Audit& out,
                            std::string& error);

/**
 * @brief Read the files (Kconfig may be gzip-compressed) and run the pipeline.
 */
[[nodiscard]] bool auditFiles(std::string_view configPath,
                              std::optional<std::string_view> cmdlinePath, Audit& out,
                              std::string& error);

/**
 * @brief Build and validate the full recommendation list for an architecture.
 * @return false if the rule database is malformed.
 */
[[nodiscard]] bool recommendations(input::Arch arch, engine::Checklist& out,
                                   std::string& error);

} // namespace audit

} // namespace kcheck

#endif // KCHECK_AUDIT_AUDIT_HPP
