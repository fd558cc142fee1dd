#include "PtyReader.hpp"

namespace uex {
PtyReader::PtyReader(int _masterFd, shared_ptr<ReaderQueue> _queue,
                     size_t _chunkSize)
    : masterFd(_masterFd),
      queue(_queue),
      chunkSize(_chunkSize),
      stopRequested(false) {}

PtyReader::~PtyReader() {
  stop();
  join();
}

void PtyReader::start() {
  readThread.reset(new thread(&PtyReader::run, this));
}

void PtyReader::join() {
  if (readThread && readThread->joinable()) {
    readThread->join();
  }
}

void PtyReader::finish(const ReaderFault& fault) {
  string leftover = decoder.flush();
  if (!leftover.empty()) {
    queue->push(ReaderItem::chunk(leftover));
  }
  queue->push(ReaderItem::failure(fault));
}

void PtyReader::run() {
  try {
    vector<char> b(chunkSize);
    while (true) {
      if (stopRequested) {
        VLOG(1) << "Reader for fd " << masterFd << " stopped";
        finish(ReaderFault(ReaderFaultKind::END_OF_STREAM, 0,
                           "reader stopped"));
        return;
      }

      pollfd pfd;
      pfd.fd = masterFd;
      pfd.events = POLLIN;
      pfd.revents = 0;
      int prc = poll(&pfd, 1, POLL_INTERVAL_MS);
      if (prc == -1) {
        int pollErrno = GetErrno();
        if (pollErrno == EINTR) {
          continue;
        }
        if (!stopRequested) {
          STERROR << "Cannot poll terminal: " << strerror(pollErrno);
        }
        finish(ReaderFault(ReaderFaultKind::IO_ERROR, pollErrno,
                           "cannot poll terminal"));
        return;
      }
      if (prc == 0) {
        continue;
      }

      // A hangup is reported by the read below
      ssize_t rc = ::read(masterFd, &b[0], b.size());
      int readErrno = GetErrno();  // Save errno before any logging
      if (rc > 0) {
        string text = decoder.decode(&b[0], size_t(rc));
        VLOG(4) << "Read " << rc << " bytes from terminal";
        if (!text.empty()) {
          queue->push(ReaderItem::chunk(text));
        }
        continue;
      }
      if (rc == 0) {
        LOG(INFO) << "Terminal session ended";
        finish(ReaderFault(ReaderFaultKind::END_OF_STREAM, 0,
                           "terminal closed"));
        return;
      }
      if (readErrno == EINTR || readErrno == EAGAIN ||
          readErrno == EWOULDBLOCK) {
        // Transient error, retry
        continue;
      }
      if (readErrno == EIO || readErrno == EBADF) {
        // The child exited or the pty was closed
        LOG(INFO) << "Terminal session ended: " << strerror(readErrno);
        finish(ReaderFault(ReaderFaultKind::IO_ERROR, readErrno,
                           "terminal went away"));
        return;
      }
      if (stopRequested) {
        VLOG(1) << "Terminal read error during shutdown: "
                << strerror(readErrno);
      } else {
        STERROR << "Terminal read error: " << readErrno << " "
                << strerror(readErrno);
      }
      finish(ReaderFault(ReaderFaultKind::IO_ERROR, readErrno,
                         "cannot read from terminal"));
      return;
    }
  } catch (const std::exception& ex) {
    if (stopRequested) {
      VLOG(1) << "Reader failed during shutdown: " << ex.what();
    } else {
      STERROR << "Reader failed: " << ex.what();
    }
    queue->push(ReaderItem::failure(
        ReaderFault(ReaderFaultKind::UNEXPECTED, 0, ex.what())));
  }
}
}  // namespace uex
