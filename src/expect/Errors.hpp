#ifndef __UEX_ERRORS__
#define __UEX_ERRORS__

#include "Headers.hpp"

namespace uex {
/**
 * @brief Thrown by `Session::read` when nothing arrived within the timeout
 * and the caller asked for an exception.
 */
class ReadTimeoutError : public std::exception {
 public:
  explicit ReadTimeoutError(Seconds _timeout);
  const char* what() const noexcept override { return message.c_str(); }
  Seconds getTimeout() const { return timeout; }

 private:
  Seconds timeout;
  std::string message;
};

/**
 * @brief Thrown by `Session::expect` when the pattern did not show up before
 * the time budget ran out.
 *
 * Carries the pattern, the requested timeout and everything that was in the
 * session buffer when the budget ran out.
 */
class ExpectTimeoutError : public std::exception {
 public:
  ExpectTimeoutError(const string& _pattern, Seconds _timeout,
                     const string& _buffer);
  const char* what() const noexcept override { return message.c_str(); }

  const string& getPattern() const { return pattern; }
  Seconds getTimeout() const { return timeout; }
  const string& getBuffer() const { return buffer; }

 private:
  string pattern;
  Seconds timeout;
  string buffer;
  std::string message;
};

/** @brief Thrown by any session operation invoked after `close()`. */
class SessionClosedError : public std::exception {
 public:
  SessionClosedError() {}
  const char* what() const noexcept override { return "closed"; }
};

/** @brief Thrown by `spawn` when the child process could not be started. */
class LaunchError : public std::exception {
 public:
  LaunchError(const string& msg, int _err);
  const char* what() const noexcept override { return message.c_str(); }
  int getErrno() const { return err; }

 private:
  int err;
  std::string message;
};

enum class ReaderFaultKind {
  END_OF_STREAM,
  IO_ERROR,
  UNEXPECTED,
};

/**
 * @brief Terminal condition observed by the reader thread.
 *
 * Never thrown on the reader thread itself; it travels through the handoff
 * queue and is thrown in the consumer's thread when dequeued.
 */
class ReaderFault : public std::exception {
 public:
  ReaderFault(ReaderFaultKind _kind, int _err, const string& msg);
  const char* what() const noexcept override { return message.c_str(); }
  ReaderFaultKind getKind() const { return kind; }
  int getErrno() const { return err; }

 private:
  ReaderFaultKind kind;
  int err;
  std::string message;
};
}  // namespace uex

#endif  // __UEX_ERRORS__
