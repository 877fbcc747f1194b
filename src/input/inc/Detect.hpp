#ifndef KCHECK_INPUT_DETECT_HPP
#define KCHECK_INPUT_DETECT_HPP
/**
 * @file Detect.hpp
 * @brief Microarchitecture, kernel version and compiler detection from
 *        Kconfig text.
 *
 * Markers:
 *  - "CONFIG_<ARCH>=y" for exactly one supported microarchitecture
 *  - "# Linux/<arch> <x.y.z> Kernel Configuration" banner
 *  - "CONFIG_GCC_VERSION=<n>" and "CONFIG_CLANG_VERSION=<n>"
 */

#include "src/input/inc/KernelVersion.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kcheck {

namespace input {

/* ----------------------------- Arch ----------------------------- */

/**
 * @brief Supported microarchitectures.
 */
enum class Arch : std::uint8_t {
  X86_64 = 0,
  X86_32,
  ARM64,
  ARM,
};

/// All supported microarchitectures, in CLI listing order.
inline constexpr std::array<Arch, 4> SUPPORTED_ARCHS = {Arch::X86_64, Arch::X86_32, Arch::ARM64,
                                                        Arch::ARM};

/**
 * @brief Convert Arch to its Kconfig token (e.g. "X86_64").
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] const char* toString(Arch arch) noexcept;

/**
 * @brief Parse a Kconfig arch token.
 * @return Arch, or nullopt if unsupported.
 */
[[nodiscard]] std::optional<Arch> archFromString(std::string_view token) noexcept;

/* ----------------------------- Compiler ----------------------------- */

/**
 * @brief Compiler family that built the kernel.
 */
enum class Compiler : std::uint8_t {
  UNKNOWN = 0, ///< No version markers found
  GCC,
  CLANG,
};

/**
 * @brief Detected compiler identity.
 */
struct CompilerInfo {
  Compiler family{Compiler::UNKNOWN};
  std::string version; ///< Raw CONFIG_*_VERSION value (e.g. "120200")

  [[nodiscard]] bool detected() const noexcept { return family != Compiler::UNKNOWN; }

  /// @brief "GCC <version>" / "CLANG <version>" / "unknown".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Detect the microarchitecture.
 * @param text  Kconfig contents.
 * @param arch  Receives the detected architecture.
 * @param error Receives "failed to detect microarchitecture" or
 *              "more than one supported microarchitecture is detected".
 * @return true if exactly one supported CONFIG_<ARCH>=y marker is present.
 */
[[nodiscard]] bool detectArch(std::string_view text, Arch& arch, std::string& error) noexcept;

/**
 * @brief Detect the kernel version from the configuration banner.
 * @param text    Kconfig contents.
 * @param version Receives (major, minor).
 * @param error   Receives a message on failure.
 * @return true on success.
 */
[[nodiscard]] bool detectKernelVersion(std::string_view text, KernelVersion& version,
                                       std::string& error) noexcept;

/**
 * @brief Detect the compiler from CONFIG_GCC_VERSION / CONFIG_CLANG_VERSION.
 *
 * Missing markers are not an error: info stays UNKNOWN and note explains
 * why. Markers that are both zero or both nonzero are inconsistent.
 *
 * @param text Kconfig contents.
 * @param info Receives the compiler identity.
 * @param note Receives the reason for UNKNOWN, or the error message.
 * @return false only for inconsistent markers.
 */
[[nodiscard]] bool detectCompiler(std::string_view text, CompilerInfo& info,
                                  std::string& note) noexcept;

} // namespace input

} // namespace kcheck

#endif // KCHECK_INPUT_DETECT_HPP
