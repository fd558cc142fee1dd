#ifndef __UEX_SESSION_CONFIG__
#define __UEX_SESSION_CONFIG__

#include "Headers.hpp"

namespace uex {
/**
 * @brief Defaults applied to every session created by `spawn`.
 */
struct SessionConfig {
  /** @brief Default expect timeout; unset means wait without bound. */
  optional<Seconds> timeout;
  /** @brief Appended to every `send()` unless overridden. */
  string eol;
  /** @brief Throttle applied before every `send()`. */
  optional<Seconds> sendDelay;
  /** @brief Longest single queue wait inside `expect`. */
  Seconds pollSlice = Seconds(0.1);
  /** @brief Largest single read from the pty master. */
  size_t readChunkSize = 64 * 1024;
  /** @brief How long a soft-terminated child may take to exit on close. */
  Seconds closeGracePeriod = Seconds(1.0);
  /** @brief easylogging++ verbose level, applied when loaded from a file. */
  int verbose = 0;

  /**
   * @brief Reads `[Session]` and `[Debug]` keys from an INI file.
   * @throws std::runtime_error if the file cannot be loaded or a value is
   * malformed.
   */
  static SessionConfig loadFromIni(const string& path);

  /** @brief Expands `\r`, `\n`, `\t` and `\\` escapes used in INI values. */
  static string unescape(const string& value);
};
}  // namespace uex

#endif  // __UEX_SESSION_CONFIG__
