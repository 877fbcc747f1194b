#ifndef KCHECK_INPUT_KERNEL_VERSION_HPP
#define KCHECK_INPUT_KERNEL_VERSION_HPP
/**
 * @file KernelVersion.hpp
 * @brief Kernel (major, minor) version pair.
 */

#include <optional>
#include <string>
#include <string_view>

namespace kcheck {

namespace input {

/**
 * @brief Kernel version as compared by version checks (major first, then minor).
 */
struct KernelVersion {
  int major{0};
  int minor{0};

  /// @brief Format as "major.minor".
  [[nodiscard]] std::string toString() const;
};

[[nodiscard]] constexpr bool operator==(const KernelVersion& a, const KernelVersion& b) noexcept {
  return a.major == b.major && a.minor == b.minor;
}

[[nodiscard]] constexpr bool operator<(const KernelVersion& a, const KernelVersion& b) noexcept {
  return a.major < b.major || (a.major == b.major && a.minor < b.minor);
}

[[nodiscard]] constexpr bool operator>=(const KernelVersion& a, const KernelVersion& b) noexcept {
  return !(a < b);
}

/**
 * @brief Parse "major.minor" (e.g. "5.10").
 * @return Version, or nullopt unless both parts are decimal integers.
 */
[[nodiscard]] std::optional<KernelVersion> parseKernelVersion(std::string_view text) noexcept;

} // namespace input

} // namespace kcheck

#endif // KCHECK_INPUT_KERNEL_VERSION_HPP
