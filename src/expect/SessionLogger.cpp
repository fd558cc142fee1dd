#include "SessionLogger.hpp"

#include "LogHandler.hpp"

namespace uex {
ElppLogSink::ElppLogSink(const string& _loggerId) : loggerId(_loggerId) {
  if (!el::Loggers::hasLogger(loggerId)) {
    LogHandler::setupSessionLogger(loggerId);
  }
}

void ElppLogSink::write(const string& text) {
  partialLine.append(text);
  size_t newline;
  while ((newline = partialLine.find('\n')) != string::npos) {
    string line = partialLine.substr(0, newline);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    CLOG(INFO, loggerId.c_str()) << line;
    partialLine.erase(0, newline + 1);
  }
}

void ElppLogSink::flush() {
  if (!partialLine.empty()) {
    CLOG(INFO, loggerId.c_str()) << partialLine;
    partialLine.clear();
  }
}

SessionLogger::SessionLogger(shared_ptr<LogSink> _sink, const string& _prefix)
    : sink(_sink), prefix(_prefix) {
  write(prefix);
}

void SessionLogger::write(const string& data) {
  if (data.empty()) {
    return;
  }
  string indented = data;
  replaceAll(indented, "\n", "\n" + prefix);
  sink->write(indented);
}

void SessionLogger::flush() { sink->flush(); }
}  // namespace uex
