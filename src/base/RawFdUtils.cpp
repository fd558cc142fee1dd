#include "RawFdUtils.hpp"

namespace uex {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      LOG(ERROR) << "Cannot write to fd " << fd << ": "
                 << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to terminal: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to terminal: descriptor closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

void RawFdUtils::drain(int fd) {
  while (::tcdrain(fd) == -1) {
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      continue;
    }
    throw std::runtime_error(string("Cannot drain terminal: ") +
                             strerror(localErrno));
  }
}
}  // namespace uex
