#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitcli/errors.hpp>

#include <csignal>
#include <system_error>

using namespace gitcli;
using namespace std::chrono_literals;

TEST_CASE("exit status strings") {
  REQUIRE(to_string(ExitStatus{Exited{0}}) == "exit 0");
  REQUIRE(to_string(ExitStatus{Signaled{SIGKILL}}) == "signal 9 (SIGKILL)");
  REQUIRE(to_string(ExitStatus{TimedOut{std::chrono::duration<double>(0.5),
                                        SIGTERM}}) ==
          "timed out after 0.5s (signal 15)");
}

TEST_CASE("failed error carries command, status and quoted stderr") {
  InvocationResult r({"git", "status"}, Exited{128}, "",
                     "fatal: not a git repository\n");
  FailedError e(r);
  REQUIRE(e.kind() == ErrorKind::Failed);
  REQUIRE(std::string(e.what()) ==
          "git status, status: exit 128, stderr: \"fatal: not a git repository\\n\"");
  REQUIRE(e.result().exit_code() == 128);
  REQUIRE(e.result().command_string() == "git status");
}

TEST_CASE("timeout error is a signaled error with its deadline") {
  InvocationResult r({"sleep", "5"},
                     TimedOut{std::chrono::duration<double>(0.25), SIGTERM}, "",
                     "");
  try {
    throw TimeoutError(r, std::chrono::duration<double>(0.25));
  } catch (const SignaledError &e) {
    REQUIRE(e.kind() == ErrorKind::TimedOut);
    auto &t = dynamic_cast<const TimeoutError &>(e);
    REQUIRE(t.timeout().count() == 0.25);
    REQUIRE(std::string(e.what()) ==
            "sleep 5, status: timed out after 0.25s (signal 15), stderr: \"\", "
            "timed out after 0.25s");
  }
}

TEST_CASE("process io error keeps its cause") {
  ProcessIOError e("Pipe Exception for git log: stdout",
                   std::make_exception_ptr(std::system_error(
                       EPIPE, std::generic_category(), "sink write")));
  REQUIRE(e.kind() == ErrorKind::ProcessIO);
  REQUIRE(e.cause());
  REQUIRE_THROWS_AS(e.rethrow_cause(), std::system_error);
}

TEST_CASE("unexpected result error points at the line") {
  UnexpectedResultError e("unknown diff status 'X'", ":1 2 3 4 X\tf", 3,
                          "full output");
  REQUIRE(e.kind() == ErrorKind::UnexpectedResult);
  REQUIRE(e.line_index() == 3);
  REQUIRE(e.output() == "full output");
  REQUIRE(std::string(e.what()) ==
          "unknown diff status 'X' at line 3: \":1 2 3 4 X\\tf\"");
}

TEST_CASE("quote escapes control characters") {
  REQUIRE(quote("a\x01" "b") == "\"a\\x01b\"");
  REQUIRE(quote("say \"hi\"\\") == "\"say \\\"hi\\\"\\\\\"");
}

TEST_CASE("error kinds can be switched on without catch ordering") {
  std::vector<ErrorKind> seen;
  auto classify = [&](auto thrower) {
    try {
      thrower();
    } catch (const Error &e) {
      seen.push_back(e.kind());
    }
  };
  classify([] { throw ArgumentError("bad"); });
  classify([] { throw ConfigError("bad"); });
  classify([] {
    throw SignaledError(InvocationResult({"x"}, Signaled{SIGSEGV}, "", ""));
  });
  REQUIRE(seen == std::vector<ErrorKind>{ErrorKind::Argument, ErrorKind::Config,
                                         ErrorKind::Signaled});
  REQUIRE(std::string(to_string(ErrorKind::TimedOut)) == "timed_out");
}
