#ifndef __UEX_PTY_LAUNCHER__
#define __UEX_PTY_LAUNCHER__

#include "Headers.hpp"

namespace uex {
/** @brief A child process attached to the slave side of a fresh pty. */
struct PtyChild {
  /** @brief PID of the child; also its process group id. */
  pid_t pid;
  /** @brief Master side of the pty, owned by the caller. */
  int masterFd;
};

/**
 * @brief Forks a pseudo-terminal and executes a command on its slave side.
 */
class PtyLauncher {
 public:
  /**
   * @brief Starts `argv[0]` (searched in PATH) with the pty slave as its
   * controlling terminal and stdin/stdout/stderr.
   *
   * The child becomes a session and process-group leader so that it and
   * its descendants can be signaled together. The master descriptor is
   * close-on-exec so later children do not inherit it.
   *
   * @throws LaunchError if the pty cannot be allocated, the fork fails, or
   * the command cannot be executed.
   */
  static PtyChild launch(const vector<string>& argv);
};
}  // namespace uex

#endif  // __UEX_PTY_LAUNCHER__
