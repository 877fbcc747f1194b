#ifndef KCHECK_HELPERS_FILES_HPP
#define KCHECK_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Whole-file text reading with transparent gzip decompression.
 *
 * Uses zlib's gzFile API, which reads plain files unchanged and inflates
 * gzip-compressed ones (e.g. /proc/config.gz). The handle is acquired
 * immediately before the read and released on every path.
 */

#include <array>
#include <cerrno>
#include <cstring> // strerror
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <zlib.h>

namespace kcheck {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Chunk size for gzread().
inline constexpr std::size_t READ_CHUNK_SIZE = 16384;

/* ----------------------------- Internal ----------------------------- */

namespace detail {

/// RAII owner for a gzFile handle.
class GzHandle {
public:
  explicit GzHandle(gzFile f) noexcept : f_(f) {}
  ~GzHandle() {
    if (f_ != nullptr) {
      ::gzclose(f_);
    }
  }
  GzHandle(const GzHandle&) = delete;
  GzHandle& operator=(const GzHandle&) = delete;

  [[nodiscard]] gzFile get() const noexcept { return f_; }

private:
  gzFile f_;
};

} // namespace detail

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read an entire file, decompressing it if it is gzip-encoded.
 * @param path  File path.
 * @param out   Receives the (decompressed) contents.
 * @param error Receives a message on failure.
 * @return true on success.
 * @note Cold-path: Allocates.
 */
[[nodiscard]] inline bool readTextFile(std::string_view path, std::string& out,
                                       std::string& error) noexcept {
  out.clear();

  const std::string PATH{path};
  errno = 0;
  detail::GzHandle file{::gzopen(PATH.c_str(), "rb")};
  if (file.get() == nullptr) {
    error = fmt::format("can't open \"{}\": {}", PATH,
                        errno != 0 ? std::strerror(errno) : "out of memory");
    return false;
  }

  std::array<char, READ_CHUNK_SIZE> buf{};
  for (;;) {
    const int N = ::gzread(file.get(), buf.data(), static_cast<unsigned>(buf.size()));
    if (N < 0) {
      int errnum = 0;
      const char* msg = ::gzerror(file.get(), &errnum);
      error = fmt::format("can't read \"{}\": {}",
                          PATH, errnum == Z_ERRNO ? std::strerror(errno) : msg);
      out.clear();
      return false;
    }
    if (N == 0) {
      break;
    }
    out.append(buf.data(), static_cast<std::size_t>(N));
  }

  return true;
}

/**
 * @brief Split file contents into lines (without line terminators).
 * @param text File contents.
 * @return Views into text; a trailing newline does not yield an empty line.
 */
[[nodiscard]] inline std::vector<std::string_view> splitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

} // namespace files
} // namespace helpers
} // namespace kcheck

#endif // KCHECK_HELPERS_FILES_HPP
