#include "Session.hpp"

#include "TestHeaders.hpp"

using namespace uex;

namespace {
// Runs `script` under sh on a fresh session.
shared_ptr<Session> spawnScript(const string& script,
                                const SessionConfig& config = SessionConfig()) {
  return spawn({"sh", "-c", script}, config);
}

Seconds since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<Seconds>(std::chrono::steady_clock::now() -
                                             start);
}

bool processExists(pid_t pid) { return ::kill(pid, 0) == 0; }
}  // namespace

TEST_CASE("Session expect waits for the pattern across chunks", "[Session]") {
  auto session = spawnScript(
      "printf abc; sleep 0.3; printf def; sleep 0.3; printf 'MARK tail'; "
      "sleep 30");

  ExpectResult result = session->expect("MARK", Seconds(10));
  REQUIRE(result.matched);
  REQUIRE(result.before == "abcdef");
  REQUIRE(result.after == "MARK");
  REQUIRE(result.groups.size() == 1);
  REQUIRE(session->before() == "abcdef");
  REQUIRE(session->after() == "MARK");
  REQUIRE(session->buffer() == " tail");
}

TEST_CASE("Session expect reuses output left by the previous match",
          "[Session]") {
  auto session = spawnScript("printf 'hello world'; sleep 30");

  ExpectResult first = session->expect("hello", Seconds(10));
  REQUIRE(first.matched);
  REQUIRE(session->buffer() == " world");

  // A zero budget still finds what is already buffered
  ExpectResult second = session->expect("w(or)ld", Seconds(0));
  REQUIRE(second.matched);
  REQUIRE(second.before == " ");
  REQUIRE(second.groups.size() == 2);
  REQUIRE(second.groups[1] == "or");
  REQUIRE(session->buffer().empty());
}

TEST_CASE("Session expect honours its time budget", "[Session]") {
  auto session = spawnScript("printf partial; sleep 30");

  auto start = std::chrono::steady_clock::now();
  try {
    session->expect("never", Seconds(0.5));
    FAIL("Expected an ExpectTimeoutError");
  } catch (const ExpectTimeoutError& ete) {
    REQUIRE(ete.getPattern() == "never");
    REQUIRE(ete.getTimeout() == Seconds(0.5));
    REQUIRE(ete.getBuffer() == "partial");
  }
  Seconds elapsed = since(start);
  REQUIRE(elapsed >= Seconds(0.45));
  REQUIRE(elapsed < Seconds(0.5 + 0.1 + 0.5));

  // The failed call consumed the buffer
  REQUIRE(session->buffer().empty());
  REQUIRE(session->before() == "partial");
  REQUIRE(session->after().empty());
}

TEST_CASE("Session expect with no data times out on schedule", "[Session]") {
  auto session = spawn({"sleep", "30"});
  auto start = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(session->expect("x", Seconds(0.3)), ExpectTimeoutError);
  REQUIRE(since(start) < Seconds(0.3 + 0.1 + 0.5));
}

TEST_CASE("Session probe expect keeps the buffer", "[Session]") {
  auto session = spawnScript("printf 'hello world'; sleep 30");
  auto sink = make_shared<CapturingLogSink>();
  session->logger(sink);

  // Give the output time to arrive so the probe sees it
  REQUIRE(session->expect("hello", Seconds(10), false, true).matched);
  REQUIRE(sink->getCaptured() == "hello");

  ExpectResult probe = session->expect("foo2", Seconds(0.2), false, true);
  REQUIRE(!probe.matched);
  REQUIRE(probe.before == " world");
  REQUIRE(session->buffer() == " world");
  // Probing mirrors nothing
  REQUIRE(sink->getCaptured() == "hello");

  ExpectResult real = session->expect("world", Seconds(10));
  REQUIRE(real.matched);
  REQUIRE(real.before == " ");
  REQUIRE(sink->getCaptured() == "hello world");
}

TEST_CASE("Session mirrors output to the logger once", "[Session]") {
  auto session = spawnScript("printf 'line1\\n'; sleep 0.3; printf done; "
                             "sleep 30");
  auto sink = make_shared<CapturingLogSink>();
  session->logger(sink, "| ");

  REQUIRE(session->expect("done", Seconds(10)).matched);
  REQUIRE(sink->getCaptured() == "| line1\r\n| done");

  REQUIRE_THROWS_AS(session->expect("never", Seconds(0.2)),
                    ExpectTimeoutError);
  REQUIRE(sink->getCaptured() == "| line1\r\n| done\n| ");
  REQUIRE(sink->getFlushes() == 1);

  session->close();
  REQUIRE(sink->getCaptured() == "| line1\r\n| done\n| \n| ");
  REQUIRE(sink->getFlushes() == 2);
}

TEST_CASE("Session mirrors text left in the buffer only once", "[Session]") {
  auto session = spawn({"printf", "hello world"});
  auto sink = make_shared<CapturingLogSink>();
  session->logger(sink);

  // The whole output is mirrored, then the reader fault ends the call
  REQUIRE_THROWS_AS(session->expect("never", Seconds(10)), ReaderFault);
  REQUIRE(session->buffer() == "hello world");
  REQUIRE(sink->getCaptured() == "hello world");

  REQUIRE(session->expect("hello", Seconds(0)).matched);
  REQUIRE(session->expect("world", Seconds(0)).matched);
  REQUIRE(sink->getCaptured() == "hello world");
}

TEST_CASE("Session expect can match literal text", "[Session]") {
  auto session = spawnScript("printf 'cost: a.b*c (x)'; sleep 30");
  ExpectResult result = session->expect("a.b*c (x)", Seconds(10), true);
  REQUIRE(result.matched);
  REQUIRE(result.after == "a.b*c (x)");
  REQUIRE(result.before == "cost: ");
  REQUIRE(Session::escapePattern("a.b") == "a\\.b");
}

TEST_CASE("Session expect handles a long line without newlines",
          "[Session]") {
  auto session = spawnScript(
      "head -c 100000 /dev/zero | tr '\\0' a; printf 'PROMPT$ '; sleep 30");

  ExpectResult result = session->expect("(.*)\\$ ", Seconds(10));
  REQUIRE(result.matched);
  REQUIRE(result.before.empty());
  REQUIRE(result.groups.size() == 2);
  REQUIRE(result.groups[1].size() == 100000 + 6);
  REQUIRE(result.groups[1].compare(100000, 6, "PROMPT") == 0);
  REQUIRE(session->buffer().empty());
}

TEST_CASE("Session expect dot matches the carriage return of pty lines",
          "[Session]") {
  auto session = spawnScript("echo 'echo foo'; echo foo; sleep 30");

  ExpectResult echoed = session->expect("echo (.*)\n", Seconds(10));
  REQUIRE(echoed.matched);
  REQUIRE(echoed.groups[1] == "foo\r");

  ExpectResult line = session->expect("foo.*\n", Seconds(10));
  REQUIRE(line.matched);
  REQUIRE(line.after == "foo\r\n");
}

TEST_CASE("Session expect rejects an invalid pattern", "[Session]") {
  auto session = spawn({"cat"});
  REQUIRE_THROWS_AS(session->expect("(unclosed", Seconds(0.1)),
                    std::invalid_argument);
}

TEST_CASE("Session expect without any timeout still completes",
          "[Session]") {
  auto session = spawnScript("sleep 0.3; printf late; sleep 30");
  REQUIRE(!session->timeout());
  REQUIRE(session->expect("late").matched);
}

TEST_CASE("Session read returns available chunks", "[Session]") {
  auto session = spawnScript("printf one; sleep 30");

  string data;
  auto start = std::chrono::steady_clock::now();
  while (data.size() < 3 && since(start) < Seconds(10)) {
    data += session->read(Seconds(1));
  }
  REQUIRE(data == "one");

  REQUIRE(session->read(Seconds(0.1)) == "");
  REQUIRE_THROWS_AS(session->read(Seconds(0.1), true), ReadTimeoutError);
}

TEST_CASE("Session read returns text queued ahead of the reader fault",
          "[Session]") {
  auto session = spawn({"printf", "bye"});
  // Let the child exit so the text and the fault are both queued
  std::this_thread::sleep_for(std::chrono::milliseconds(500));

  string data;
  auto start = std::chrono::steady_clock::now();
  while (data.size() < 3 && since(start) < Seconds(10)) {
    data += session->read(Seconds(1));
  }
  REQUIRE(data == "bye");
  REQUIRE_THROWS_AS(session->read(Seconds(1)), ReaderFault);
  // Delivered once only
  REQUIRE(session->read(Seconds(0.1)) == "");
}

TEST_CASE("Session send appends exactly one end of line", "[Session]") {
  auto session = spawnScript("stty -echo -icrnl -icanon; printf READY; cat");
  session->eol("\r");
  REQUIRE(session->expect("READY", Seconds(10)).matched);

  REQUIRE(session->send("foo") == 4);
  REQUIRE(session->send("foo") == 4);
  REQUIRE(session->eol() == "\r");
  REQUIRE(session->send("bar", string("!")) == 4);

  ExpectResult result = session->expect("foo\rfoo\rbar!", Seconds(10));
  REQUIRE(result.matched);
  REQUIRE(countOccurrences(result.after, "\r") == 2);
  REQUIRE(countOccurrences(result.after, "!") == 1);
}

TEST_CASE("Session send sleeps the configured delay", "[Session]") {
  SessionConfig config;
  config.sendDelay = Seconds(0.2);
  auto session = spawn({"cat"}, config);

  auto start = std::chrono::steady_clock::now();
  session->send("x");
  REQUIRE(since(start) >= Seconds(0.19));

  start = std::chrono::steady_clock::now();
  session->send("y", nullopt, Seconds(0));
  REQUIRE(since(start) < Seconds(0.19));
}

TEST_CASE("Session accessors", "[Session]") {
  SessionConfig config;
  config.timeout = Seconds(7);
  config.eol = "\r";
  auto session = spawn({"cat"}, config);

  REQUIRE(session->timeout());
  REQUIRE(*session->timeout() == Seconds(7));
  REQUIRE(*session->timeout(Seconds(3)) == Seconds(3));
  REQUIRE(*session->timeout(Seconds(0)) == Seconds(3));

  REQUIRE(session->eol() == "\r");
  REQUIRE(session->eol("\n") == "\n");
  REQUIRE(session->eol("") == "\n");

  REQUIRE(session->logger() == nullptr);
  REQUIRE(session->logger(nullptr) == nullptr);
  auto sink = make_shared<CapturingLogSink>();
  auto adapter = session->logger(sink, "> ");
  REQUIRE(adapter != nullptr);
  REQUIRE(session->logger(sink, "> ") == adapter);
  REQUIRE(sink->getCaptured() == "> ");
  auto otherSink = make_shared<CapturingLogSink>();
  REQUIRE(session->logger(otherSink) != adapter);
  REQUIRE(session->logger()->getSink() == otherSink);
}

TEST_CASE("Session close is idempotent", "[Session]") {
  auto session = spawn({"cat"});
  pid_t pid = session->pid();
  REQUIRE(!session->isClosed());

  session->close();
  REQUIRE(session->isClosed());
  REQUIRE_NOTHROW(session->close());
  REQUIRE(!processExists(pid));

  REQUIRE_THROWS_AS(session->write("x"), SessionClosedError);
  REQUIRE_THROWS_AS(session->send("x"), SessionClosedError);
  REQUIRE_THROWS_AS(session->read(Seconds(0.1)), SessionClosedError);
  REQUIRE_THROWS_AS(session->expect("x", Seconds(0.1)), SessionClosedError);
}

TEST_CASE("Session soft close escalates when SIGTERM is ignored",
          "[Session]") {
  SessionConfig config;
  config.closeGracePeriod = Seconds(0.3);
  auto session = spawnScript(
      "trap '' TERM; printf READY; while :; do sleep 1; done", config);
  REQUIRE(session->expect("READY", Seconds(10)).matched);
  pid_t pid = session->pid();

  session->close(false);
  REQUIRE(session->isClosed());
  REQUIRE(!processExists(pid));
}

TEST_CASE("Session destructor closes the session", "[Session]") {
  pid_t pid;
  {
    auto session = spawn({"sleep", "30"});
    pid = session->pid();
    REQUIRE(processExists(pid));
  }
  REQUIRE(!processExists(pid));
}

TEST_CASE("Session forwards the reader fault once the child is gone",
          "[Session]") {
  auto session = spawn({"printf", "done"});
  REQUIRE(session->expect("done", Seconds(10)).matched);

  REQUIRE_THROWS_AS(session->expect("more", Seconds(10)), ReaderFault);
  // The reader is gone; later calls only time out
  REQUIRE_THROWS_AS(session->expect("more", Seconds(0.2)),
                    ExpectTimeoutError);
}

TEST_CASE("Sessions do not share output", "[Session]") {
  auto sessionA = spawn({"cat"});
  auto sessionB = spawn({"cat"});
  REQUIRE(sessionA->pid() != sessionB->pid());

  sessionB->send("only-b", string("\n"));
  REQUIRE(sessionB->expect("only-b", Seconds(10)).matched);
  REQUIRE_THROWS_AS(sessionA->expect("only-b", Seconds(0.5)),
                    ExpectTimeoutError);
}

TEST_CASE("spawn reports commands that cannot start", "[Session]") {
  REQUIRE_THROWS_AS(spawn({"/nonexistent/uex-command"}), LaunchError);
}
