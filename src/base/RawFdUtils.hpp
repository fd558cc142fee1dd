#ifndef __UEX_RAW_FD_UTILS__
#define __UEX_RAW_FD_UTILS__

#include "Headers.hpp"

namespace uex {
/**
 * @brief Simple blocking wrappers around POSIX descriptor write loops.
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN and EINTR.
   * @throws std::runtime_error if the descriptor is invalid or the write
   * fails.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Blocks until all output written to the terminal `fd` has been
   * transmitted (tcdrain).
   */
  static void drain(int fd);
};
}  // namespace uex
#endif  // __UEX_RAW_FD_UTILS__
