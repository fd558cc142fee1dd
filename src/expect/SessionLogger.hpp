#ifndef __UEX_SESSION_LOGGER__
#define __UEX_SESSION_LOGGER__

#include "Headers.hpp"

namespace uex {
/**
 * @brief Destination for session output mirrored by `Session::expect`.
 */
class LogSink {
 public:
  virtual ~LogSink() {}

  virtual void write(const string& text) = 0;
  virtual void flush() = 0;
};

/** @brief Writes mirrored output to a `std::ostream`. */
class StreamLogSink : public LogSink {
 public:
  explicit StreamLogSink(std::ostream& _out) : out(_out) {}

  void write(const string& text) override { out << text; }
  void flush() override { out.flush(); }

 protected:
  std::ostream& out;
};

/**
 * @brief Emits mirrored output to an easylogging++ logger, one record per
 * completed line.
 */
class ElppLogSink : public LogSink {
 public:
  /**
   * @brief Mirrors into `_loggerId`. A logger that does not exist yet is
   * created as a message-only logger; an existing one keeps its
   * configuration.
   */
  explicit ElppLogSink(const string& _loggerId);

  virtual ~ElppLogSink() { flush(); }

  void write(const string& text) override;

  /** @brief Emits the pending partial line, if any. */
  void flush() override;

 protected:
  string loggerId;
  string partialLine;
};

/**
 * @brief Wraps a `LogSink`, indenting every mirrored line with a prefix.
 *
 * The prefix is written once when the adapter is created and again after
 * every newline.
 */
class SessionLogger {
 public:
  SessionLogger(shared_ptr<LogSink> _sink, const string& _prefix = "");

  void write(const string& data);
  void flush();

  shared_ptr<LogSink> getSink() const { return sink; }
  const string& getPrefix() const { return prefix; }

 protected:
  shared_ptr<LogSink> sink;
  string prefix;
};
}  // namespace uex

#endif  // __UEX_SESSION_LOGGER__
