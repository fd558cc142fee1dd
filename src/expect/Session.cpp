#include "Session.hpp"

#include "RawFdUtils.hpp"

#include <re2/re2.h>

namespace uex {
namespace {
const Seconds UNBOUNDED_TIMEOUT = Seconds(std::numeric_limits<double>::max());

Seconds elapsedSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<Seconds>(std::chrono::steady_clock::now() -
                                             start);
}
}  // namespace

Session::Session(const PtyChild& child, const SessionConfig& config)
    : childPid(child.pid),
      masterFd(child.masterFd),
      queue(new ReaderQueue()),
      closed(false),
      loggerBufferPos(0),
      defaultTimeout(config.timeout),
      eolString(config.eol),
      sendDelay(config.sendDelay),
      pollSlice(config.pollSlice),
      closeGracePeriod(config.closeGracePeriod) {
  reader.reset(new PtyReader(masterFd, queue, config.readChunkSize));
  reader->start();
}

Session::~Session() {
  try {
    close();
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Error closing session for pid " << childPid << ": "
               << ex.what();
  }
}

bool Session::isClosed() {
  lock_guard<std::mutex> guard(sessionMutex);
  return closed;
}

optional<Seconds> Session::timeout(Seconds newTimeout) {
  if (newTimeout > Seconds::zero()) {
    defaultTimeout = newTimeout;
  }
  return defaultTimeout;
}

const string& Session::eol(const string& newEol) {
  if (!newEol.empty()) {
    eolString = newEol;
  }
  return eolString;
}

shared_ptr<SessionLogger> Session::logger(shared_ptr<LogSink> sink,
                                          const string& prefix) {
  if (sink && (!sessionLogger || sessionLogger->getSink() != sink)) {
    sessionLogger.reset(new SessionLogger(sink, prefix));
  }
  return sessionLogger;
}

string Session::escapePattern(const string& text) {
  static const string metacharacters = "\\^$.|?*+()[]{}";
  string escaped;
  for (char c : text) {
    if (metacharacters.find(c) != string::npos) {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

void Session::mirror(size_t end) {
  if (sessionLogger && loggerBufferPos < end) {
    sessionLogger->write(
        expectBuffer.substr(loggerBufferPos, end - loggerBufferPos));
  }
}

ExpectResult Session::expect(const string& pattern, optional<Seconds> timeout,
                             bool escape, bool expectTimeout) {
  lastBefore.clear();
  lastAfter.clear();

  ExpectResult result;
  result.pattern = escape ? escapePattern(pattern) : pattern;
  RE2::Options options;
  options.set_log_errors(false);
  RE2 re(result.pattern, options);
  if (!re.ok()) {
    throw std::invalid_argument("Invalid pattern '" + result.pattern +
                                "': " + re.error());
  }
  const int groupCount = 1 + re.NumberOfCapturingGroups();
  vector<re2::StringPiece> match(groupCount);

  if (!timeout) {
    timeout = defaultTimeout;
  }
  Seconds timeleft = timeout ? *timeout : UNBOUNDED_TIMEOUT;
  VLOG(2) << "Expecting '" << result.pattern << "' for " << timeleft.count()
          << "s";

  while (true) {
    auto startTime = std::chrono::steady_clock::now();

    if (!expectBuffer.empty()) {
      if (re.Match(expectBuffer, 0, expectBuffer.size(), RE2::UNANCHORED,
                   match.data(), groupCount)) {
        size_t matchStart = size_t(match[0].data() - expectBuffer.data());
        size_t matchEnd = matchStart + match[0].size();
        mirror(matchEnd);
        result.matched = true;
        result.before = expectBuffer.substr(0, matchStart);
        result.after = match[0].as_string();
        for (const auto& group : match) {
          // Groups that did not take part in the match come back empty
          result.groups.push_back(group.as_string());
        }
        expectBuffer.erase(0, matchEnd);
        // Text past the match may already have been mirrored
        loggerBufferPos =
            loggerBufferPos > matchEnd ? loggerBufferPos - matchEnd : 0;
        lastBefore = result.before;
        lastAfter = result.after;
        return result;
      } else if (!expectTimeout) {
        mirror(expectBuffer.size());
        loggerBufferPos = expectBuffer.size();
      }
    }

    string data;
    try {
      data = read(std::min(timeleft, pollSlice), true);
    } catch (const ReadTimeoutError&) {
      timeleft = std::max(timeleft - elapsedSince(startTime), Seconds::zero());
      if (timeleft > Seconds::zero()) {
        continue;
      }
      if (sessionLogger && !expectTimeout) {
        mirror(expectBuffer.size());
        sessionLogger->write("\n");
        sessionLogger->flush();
      }
      result.before = expectBuffer;
      lastBefore = expectBuffer;
      if (expectTimeout) {
        VLOG(2) << "Probe for '" << result.pattern << "' timed out";
        return result;
      }
      string snapshot;
      snapshot.swap(expectBuffer);
      loggerBufferPos = 0;
      throw ExpectTimeoutError(result.pattern,
                               timeout ? *timeout : UNBOUNDED_TIMEOUT,
                               snapshot);
    }
    timeleft = std::max(timeleft - elapsedSince(startTime), Seconds::zero());
    expectBuffer.append(data);
  }
}

string Session::read(Seconds timeout, bool raiseOnTimeout) {
  {
    lock_guard<std::mutex> guard(sessionMutex);
    if (closed) {
      throw SessionClosedError();
    }
  }
  if (pendingFault) {
    ReaderFault fault = *pendingFault;
    pendingFault.reset();
    throw fault;
  }

  string data;
  Seconds timeleft = timeout;
  ReaderItem item;
  while (true) {
    auto startTime = std::chrono::steady_clock::now();
    Seconds wait = std::min(timeleft, Seconds(MAX_QUEUE_WAIT_SECONDS));
    if (queue->pop(&item, wait)) {
      if (item.isFault()) {
        throw *item.fault;
      }
      data.append(item.text);
      // Take whatever else is already queued without waiting again
      while (queue->tryPop(&item)) {
        if (item.isFault()) {
          pendingFault = item.fault;
          break;
        }
        data.append(item.text);
      }
      if (!data.empty()) {
        VLOG(4) << "Read " << data.size() << " bytes from session";
        return data;
      }
      if (pendingFault) {
        ReaderFault fault = *pendingFault;
        pendingFault.reset();
        throw fault;
      }
    }
    timeleft = std::max(timeleft - elapsedSince(startTime), Seconds::zero());
    if (timeleft <= Seconds::zero()) {
      break;
    }
  }

  if (raiseOnTimeout) {
    throw ReadTimeoutError(timeout);
  }
  return data;
}

size_t Session::write(const string& data) {
  lock_guard<std::mutex> guard(sessionMutex);
  if (closed) {
    throw SessionClosedError();
  }
  RawFdUtils::writeAll(masterFd, data.data(), data.size());
  RawFdUtils::drain(masterFd);
  VLOG(3) << "Wrote " << data.size() << " bytes to pid " << childPid;
  return data.size();
}

size_t Session::send(const string& data, optional<string> eol,
                     optional<Seconds> delay) {
  if (!eol) {
    eol = eolString;
  }
  if (!delay) {
    delay = sendDelay;
  }
  if (delay && *delay > Seconds::zero()) {
    std::this_thread::sleep_for(*delay);
  }
  return write(data + *eol);
}

void Session::close(bool force) {
  lock_guard<std::mutex> guard(sessionMutex);
  if (closed) {
    return;
  }
  VLOG(1) << "Closing session for pid " << childPid;

  reader->stop();
  // The child leads its own process group; take its descendants down too
  if (::kill(-childPid, SIGTERM) == -1 && GetErrno() != ESRCH) {
    LOG(WARNING) << "Cannot signal process group " << childPid << ": "
                 << strerror(GetErrno());
  }
  if (::kill(childPid, force ? SIGKILL : SIGTERM) == -1 &&
      GetErrno() != ESRCH) {
    LOG(WARNING) << "Cannot signal pid " << childPid << ": "
                 << strerror(GetErrno());
  }
  reader->join();
  ::close(masterFd);
  reapChild(force);
  closed = true;

  if (sessionLogger) {
    sessionLogger->write("\n");
    sessionLogger->flush();
  }
}

void Session::reapChild(bool killed) {
  int status;
  if (!killed) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::duration_cast<
                        std::chrono::steady_clock::duration>(closeGracePeriod);
    while (true) {
      pid_t rc = waitpid(childPid, &status, WNOHANG);
      if (rc == childPid) {
        return;
      }
      if (rc == -1 && GetErrno() != EINTR) {
        // Already reaped elsewhere
        return;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    LOG(INFO) << "Pid " << childPid << " ignored SIGTERM, sending SIGKILL";
    ::kill(childPid, SIGKILL);
  }

  pid_t rc;
  do {
    rc = waitpid(childPid, &status, 0);
  } while (rc == -1 && GetErrno() == EINTR);
}

shared_ptr<Session> spawn(const vector<string>& argv,
                          const SessionConfig& config) {
  PtyChild child = PtyLauncher::launch(argv);
  try {
    return shared_ptr<Session>(new Session(child, config));
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Cannot start session for " << argv[0] << ": " << ex.what();
    ::kill(child.pid, SIGKILL);
    ::close(child.masterFd);
    int throwaway;
    waitpid(child.pid, &throwaway, 0);
    throw;
  }
}
}  // namespace uex
