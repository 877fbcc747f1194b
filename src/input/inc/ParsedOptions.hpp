#ifndef KCHECK_INPUT_PARSED_OPTIONS_HPP
#define KCHECK_INPUT_PARSED_OPTIONS_HPP
/**
 * @file ParsedOptions.hpp
 * @brief Insertion-ordered option name -> raw value mapping.
 *
 * One instance per data source (Kconfig file, cmdline file). Lookup is by
 * name; iteration follows first-insertion order, which is only used for
 * diagnostic listings.
 */

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace kcheck {

namespace input {

/* ----------------------------- Constants ----------------------------- */

/// Value recorded for "# CONFIG_X is not set" lines.
inline constexpr std::string_view OFF_MARKER = "is not set";

/* ----------------------------- ParsedOption ----------------------------- */

/**
 * @brief One option discovered in a data source.
 */
struct ParsedOption {
  std::string name;  ///< Option name (e.g. "CONFIG_BUG", "init_on_alloc")
  std::string value; ///< Raw value; OFF_MARKER for explicitly disabled Kconfig options
};

/* ----------------------------- ParsedOptions ----------------------------- */

/**
 * @brief Ordered mapping of parsed options.
 */
class ParsedOptions {
public:
  /**
   * @brief Add a new option.
   * @return false (and leaves the mapping unchanged) if name already exists.
   */
  [[nodiscard]] bool insert(std::string name, std::string value);

  /**
   * @brief Add or overwrite an option. An overwritten option keeps its
   *        original position.
   */
  void assign(std::string name, std::string value);

  /**
   * @brief Look up an option value.
   * @return Pointer to the stored value, or nullptr if absent.
   */
  [[nodiscard]] const std::string* find(std::string_view name) const noexcept;

  /// @brief Check whether an option is present.
  [[nodiscard]] bool contains(std::string_view name) const noexcept {
    return find(name) != nullptr;
  }

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  [[nodiscard]] auto begin() const noexcept { return entries_.begin(); }
  [[nodiscard]] auto end() const noexcept { return entries_.end(); }

private:
  std::vector<ParsedOption> entries_;
  std::map<std::string, std::size_t, std::less<>> index_;
};

} // namespace input

} // namespace kcheck

#endif // KCHECK_INPUT_PARSED_OPTIONS_HPP
