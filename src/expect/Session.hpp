#ifndef __UEX_SESSION__
#define __UEX_SESSION__

#include "Errors.hpp"
#include "Headers.hpp"
#include "PtyLauncher.hpp"
#include "PtyReader.hpp"
#include "SessionConfig.hpp"
#include "SessionLogger.hpp"

namespace uex {
/** @brief Outcome of one `Session::expect` call. */
struct ExpectResult {
  /** @brief False only when a probing expect ran out of time. */
  bool matched = false;
  /** @brief Regular expression that was searched for (after escaping). */
  string pattern;
  /** @brief Buffered text preceding the match, or the whole buffer on a
   * timeout. */
  string before;
  /** @brief The matched text. */
  string after;
  /** @brief Sub-match texts; `groups[0]` equals `after`. */
  vector<string> groups;
};

/**
 * @brief Controls one child process running on a pseudo-terminal.
 *
 * Output is collected by a `PtyReader` thread and consumed here: `read`
 * returns raw chunks, `expect` accumulates them until a pattern matches.
 * Input goes straight to the pty master through `write` and `send`.
 *
 * A session has a single logical consumer; concurrent `expect` calls are
 * not supported. Destroying the session closes it.
 */
class Session {
 public:
  /** @brief Upper bound for a single wait on the reader queue. */
  static constexpr double MAX_QUEUE_WAIT_SECONDS = 3600.0;

  /**
   * @brief Takes ownership of a launched child and starts reading its
   * output.
   */
  Session(const PtyChild& child, const SessionConfig& config = SessionConfig());

  /** @brief Closes the session; errors are logged, never thrown. */
  virtual ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /**
   * @brief Waits until buffered output matches `pattern`.
   *
   * @param pattern RE2 regular expression, or literal text when `escape` is
   * set. `.` matches any character except `\n`, including the `\r` of pty
   * line endings.
   * @param timeout Overrides the session default. With neither set the wait
   * is unbounded but still sliced.
   * @param expectTimeout Probe mode: running out of time returns an
   * unmatched result, leaves the buffer intact and mirrors nothing.
   *
   * @throws ExpectTimeoutError when time runs out outside probe mode.
   * @throws ReaderFault when the reader thread reported a failure.
   * @throws SessionClosedError after `close()`.
   * @throws std::invalid_argument for an invalid pattern.
   */
  ExpectResult expect(const string& pattern,
                      optional<Seconds> timeout = nullopt, bool escape = false,
                      bool expectTimeout = false);

  /**
   * @brief Returns the next chunk(s) of output, waiting up to `timeout`.
   *
   * Everything already queued behind the first chunk is returned with it.
   * On timeout returns an empty string, or throws `ReadTimeoutError` if
   * `raiseOnTimeout` is set.
   */
  string read(Seconds timeout = Seconds::zero(), bool raiseOnTimeout = false);

  /**
   * @brief Writes `data` to the terminal and waits until it is transmitted.
   * @return Number of bytes written.
   */
  size_t write(const string& data);

  /**
   * @brief Writes `data` followed by an end-of-line marker.
   * @param eol Overrides the session end-of-line.
   * @param delay Overrides the configured throttle slept before writing.
   */
  size_t send(const string& data, optional<string> eol = nullopt,
              optional<Seconds> delay = nullopt);

  /**
   * @brief Stops the reader, signals the child's process group, kills the
   * child and releases the terminal. Later calls do nothing.
   * @param force Use SIGKILL instead of SIGTERM on the child.
   */
  void close(bool force = true);

  optional<Seconds> timeout() const { return defaultTimeout; }
  /** @brief Sets the default expect timeout if positive. */
  optional<Seconds> timeout(Seconds newTimeout);

  const string& eol() const { return eolString; }
  /** @brief Sets the end-of-line marker if non-empty. */
  const string& eol(const string& newEol);

  shared_ptr<SessionLogger> logger() const { return sessionLogger; }
  /**
   * @brief Mirrors session output into `sink`, each line indented with
   * `prefix`. Passing the sink that is already attached keeps the existing
   * adapter.
   */
  shared_ptr<SessionLogger> logger(shared_ptr<LogSink> sink,
                                   const string& prefix = "");

  /** @brief `before` of the last expect. */
  const string& before() const { return lastBefore; }
  /** @brief `after` of the last expect. */
  const string& after() const { return lastAfter; }
  /** @brief Output received but not consumed by a match yet. */
  const string& buffer() const { return expectBuffer; }

  pid_t pid() const { return childPid; }
  bool isClosed();

  /** @brief Escapes regular expression metacharacters in `text`. */
  static string escapePattern(const string& text);

 protected:
  /** @brief Waits for the child to exit, escalating to SIGKILL after the
   * grace period. */
  void reapChild(bool killed);

  /** @brief Writes buffered text from `loggerBufferPos` up to `end`. */
  void mirror(size_t end);

  pid_t childPid;
  int masterFd;
  shared_ptr<ReaderQueue> queue;
  unique_ptr<PtyReader> reader;
  /** @brief Guards the descriptor, the closed flag and writes. */
  std::mutex sessionMutex;
  bool closed;
  /** @brief A fault found while draining; thrown by the next `read`. */
  optional<ReaderFault> pendingFault;

  string expectBuffer;
  string lastBefore;
  string lastAfter;
  shared_ptr<SessionLogger> sessionLogger;
  /** @brief Length of `expectBuffer` already mirrored to the logger. */
  size_t loggerBufferPos;

  optional<Seconds> defaultTimeout;
  string eolString;
  optional<Seconds> sendDelay;
  Seconds pollSlice;
  Seconds closeGracePeriod;
};

/**
 * @brief Launches `argv` on a new pseudo-terminal and returns a session
 * controlling it.
 * @throws LaunchError if the command cannot be started.
 */
shared_ptr<Session> spawn(const vector<string>& argv,
                          const SessionConfig& config = SessionConfig());
}  // namespace uex

#endif  // __UEX_SESSION__
