#ifndef __UEX_PTY_READER__
#define __UEX_PTY_READER__

#include "Errors.hpp"
#include "HandoffQueue.hpp"
#include "Headers.hpp"
#include "Utf8Decoder.hpp"

namespace uex {
/**
 * @brief One element of the reader-to-session channel: either a chunk of
 * decoded text or the fault that ended the reader.
 */
struct ReaderItem {
  string text;
  optional<ReaderFault> fault;

  bool isFault() const { return fault.has_value(); }

  static ReaderItem chunk(const string& text) {
    ReaderItem item;
    item.text = text;
    return item;
  }

  static ReaderItem failure(const ReaderFault& fault) {
    ReaderItem item;
    item.fault = fault;
    return item;
  }
};

typedef HandoffQueue<ReaderItem> ReaderQueue;

/**
 * @brief Background thread that reads a pty master and hands decoded text to
 * a session.
 *
 * The thread pushes exactly one fault and exits: when the pty reports end of
 * stream or an error, or when `stop()` is requested. Errors never escape the
 * thread except through the queue.
 */
class PtyReader {
 public:
  /** @brief How long one wait for readability may block before the stop flag
   * is checked again. */
  static constexpr int POLL_INTERVAL_MS = 100;

  PtyReader(int _masterFd, shared_ptr<ReaderQueue> _queue, size_t _chunkSize);

  /** @brief Requests a stop and waits for the thread to exit. */
  virtual ~PtyReader();

  void start();

  /** @brief Raises the stop flag; does not wait. */
  void stop() { stopRequested = true; }

  /** @brief Waits for the thread to exit. */
  void join();

 protected:
  void run();
  /** @brief Pushes escaped decoder leftovers followed by the fault. */
  void finish(const ReaderFault& fault);

  int masterFd;
  shared_ptr<ReaderQueue> queue;
  size_t chunkSize;
  Utf8Decoder decoder;
  std::atomic<bool> stopRequested;
  unique_ptr<thread> readThread;
};
}  // namespace uex

#endif  // __UEX_PTY_READER__
