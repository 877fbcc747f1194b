#ifndef KCHECK_ENGINE_CHECK_HPP
#define KCHECK_ENGINE_CHECK_HPP
/**
 * @file Check.hpp
 * @brief Hardening check model: leaf checks, AND/OR combinators and
 *        version-gated alternatives.
 *
 * A Check is a tagged variant. Every node carries an optional evaluation
 * result; nodes skipped by short-circuiting or branch selection keep it
 * empty.
 *
 * Lifecycle per run: build (rules) -> populate -> refine -> evaluate -> report.
 */

#include "src/input/inc/KernelVersion.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kcheck {

namespace engine {

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Data source a leaf check reads.
 */
enum class DataSource : std::uint8_t {
  KCONFIG = 0, ///< Kconfig file options
  CMDLINE,     ///< Kernel boot command line parameters
  VERSION,     ///< Detected kernel (major, minor) version
};

/**
 * @brief Convert DataSource to its report token ("kconfig", "cmdline", "version").
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] const char* toString(DataSource source) noexcept;

/**
 * @brief How a leaf compares the found value with the expected one.
 */
enum class Comparison : std::uint8_t {
  EQUALS = 0, ///< Found value equals expected (quotes ignored)
  NOT_OFF,    ///< Found value is anything but an off value
  NOT_SET,    ///< Found value is the off-marker, or the option is absent
  PRESENT,    ///< Option appears in the source at all
  AT_LEAST,   ///< Integer found value >= integer threshold
  AT_MOST,    ///< Integer found value <= integer threshold
};

/**
 * @brief Outcome of one check.
 */
enum class Verdict : std::uint8_t {
  OK = 0,
  FAIL,
  UNKNOWN, ///< Relevant option is absent from every supplied source
};

/**
 * @brief Convert Verdict to string ("OK", "FAIL", "UNKNOWN").
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] const char* toString(Verdict verdict) noexcept;

/**
 * @brief Boolean combinator over sub-checks.
 */
enum class Combinator : std::uint8_t {
  AND = 0, ///< Every child must pass
  OR,      ///< At least one child must pass
};

/**
 * @brief Convert Combinator to string ("AND", "OR").
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] const char* toString(Combinator op) noexcept;

/* ----------------------------- Tag ----------------------------- */

/**
 * @brief Static decision strength attached to a rule at registration.
 */
struct Tag {
  std::string reason;   ///< Category, e.g. "self_protection", "cut_attack_surface"
  std::string decision; ///< Source of the recommendation, e.g. "kspp", "defconfig"
};

/* ----------------------------- EvaluationResult ----------------------------- */

/**
 * @brief Result attached to a check node by evaluation.
 */
struct EvaluationResult {
  Verdict verdict{Verdict::UNKNOWN};
  std::string reason;               ///< Names the option and the comparison made
  std::optional<std::string> found; ///< Value the verdict is based on; nullopt if absent

  /// @brief "<VERDICT>: <reason>".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Check Nodes ----------------------------- */

struct Check;

/**
 * @brief Check of one option in one data source.
 */
struct LeafCheck {
  Tag tag{};
  std::string name;                   ///< "CONFIG_BUG", "init_on_alloc", "kernel version"
  DataSource source{DataSource::KCONFIG};
  Comparison comparison{Comparison::EQUALS};
  std::string expected;               ///< Value or threshold (empty for NOT_OFF/NOT_SET/PRESENT)

  /* --- Attached by population --- */

  std::optional<std::string> found;                  ///< Raw value; nullopt if absent
  std::optional<input::KernelVersion> kernelVersion; ///< For VERSION leaves

  /// @brief Expected value as shown in reports ("y", "is not set", ">= 32").
  [[nodiscard]] std::string expectedText() const;
};

/**
 * @brief AND/OR over an ordered, non-empty list of sub-checks.
 */
struct CombinatorCheck {
  Combinator op{Combinator::AND};
  std::vector<Check> children;
};

/**
 * @brief Selects one of two sub-checks by kernel version.
 *
 * branches[BEFORE] applies to kernels older than threshold,
 * branches[AFTER] to threshold and newer.
 */
struct VersionGatedCheck {
  static constexpr std::size_t BEFORE = 0;
  static constexpr std::size_t AFTER = 1;

  input::KernelVersion threshold{};
  std::vector<Check> branches;

  /// Attached by population.
  std::optional<input::KernelVersion> kernelVersion;
};

/// Tagged check node.
using CheckNode = std::variant<LeafCheck, CombinatorCheck, VersionGatedCheck>;

/**
 * @brief One recommendation (or sub-recommendation) and its evaluation result.
 */
struct Check {
  CheckNode node;
  std::optional<EvaluationResult> result;

  [[nodiscard]] bool isLeaf() const noexcept { return std::holds_alternative<LeafCheck>(node); }
};

/// Ordered top-level checks of one run.
using Checklist = std::vector<Check>;

/* ----------------------------- Construction ----------------------------- */

/**
 * @brief Build a leaf from an expected-value token.
 *
 * "is not set" -> NOT_SET, "is not off" -> NOT_OFF, "is present" -> PRESENT,
 * anything else -> EQUALS against that value.
 */
[[nodiscard]] Check makeLeaf(DataSource source, Tag tag, std::string name,
                             std::string_view expected);

/// @brief Build a numeric threshold leaf (AT_LEAST or AT_MOST).
[[nodiscard]] Check makeThreshold(DataSource source, Tag tag, std::string name,
                                  Comparison comparison, std::string threshold);

/// @brief Build a "kernel version >= threshold" leaf.
[[nodiscard]] Check makeVersion(input::KernelVersion threshold);

/// @brief Build an AND/OR combinator.
[[nodiscard]] Check makeCombinator(Combinator op, std::vector<Check> children);

/// @brief Build a version-gated alternative.
[[nodiscard]] Check makeVersionGated(input::KernelVersion threshold, Check before, Check after);

/* ----------------------------- Queries ----------------------------- */

/**
 * @brief Leaf a check is about: itself, the first child of a combinator,
 *        or the AFTER branch of a version gate (recursively).
 */
[[nodiscard]] const LeafCheck& primaryLeaf(const Check& check) noexcept;

/// @brief Collect the names of all non-version leaves in a check tree.
void collectLeafNames(const Check& check, std::set<std::string, std::less<>>& names);

/**
 * @brief Verify structural invariants: combinators have children, version
 *        gates have exactly two branches, top-level checks are not about the
 *        kernel version alone (nested version leaves are allowed).
 * @param checklist Checks to verify.
 * @param error     Receives a message naming the offending check.
 * @return true if every check is well-formed.
 */
[[nodiscard]] bool validate(const Checklist& checklist, std::string& error);

/// @brief Drop every evaluation result in a check tree.
void clearResults(Check& check) noexcept;

} // namespace engine

} // namespace kcheck

#endif // KCHECK_ENGINE_CHECK_HPP
