#include "Errors.hpp"

namespace uex {
namespace {
string formatTimeout(Seconds timeout) {
  char buf[64];
  snprintf(buf, sizeof(buf), "Timeout %.3fs", timeout.count());
  return string(buf);
}

string hexBytes(const string& s) {
  std::ostringstream ss;
  ss << std::hex;
  for (size_t a = 0; a < s.size(); a++) {
    if (a) ss << ",";
    ss << int((unsigned char)s[a]);
  }
  return ss.str();
}

string faultKindToString(ReaderFaultKind kind) {
  switch (kind) {
    case ReaderFaultKind::END_OF_STREAM:
      return "end of stream";
    case ReaderFaultKind::IO_ERROR:
      return "I/O error";
    case ReaderFaultKind::UNEXPECTED:
    default:
      return "unexpected failure";
  }
}
}  // namespace

ReadTimeoutError::ReadTimeoutError(Seconds _timeout)
    : timeout(_timeout), message(formatTimeout(_timeout)) {}

ExpectTimeoutError::ExpectTimeoutError(const string& _pattern,
                                       Seconds _timeout,
                                       const string& _buffer)
    : pattern(_pattern), timeout(_timeout), buffer(_buffer) {
  message = formatTimeout(timeout) + " ";
  if (!pattern.empty()) {
    message += "for '" + pattern + "' ";
  }
  if (!buffer.empty()) {
    message += "buffer '" + buffer + "' ";
    message += "or '" + hexBytes(buffer) + "'";
  }
}

LaunchError::LaunchError(const string& msg, int _err) : err(_err) {
  message = msg;
  if (err) {
    message += string(": ") + strerror(err);
  }
}

ReaderFault::ReaderFault(ReaderFaultKind _kind, int _err, const string& msg)
    : kind(_kind), err(_err) {
  message = faultKindToString(kind) + ": " + msg;
  if (err) {
    message += " (" + std::to_string(err) + ": " + strerror(err) + ")";
  }
}
}  // namespace uex
