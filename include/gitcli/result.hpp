#pragma once
#include <chrono>
#include <string>
#include <variant>
#include <vector>

namespace gitcli {

struct Exited {
  int code = 0;
};

struct Signaled {
  int signal = 0;
};

struct TimedOut {
  std::chrono::duration<double> after{0};
  int signal_used = 0;
};

using ExitStatus = std::variant<Exited, Signaled, TimedOut>;

std::string to_string(const ExitStatus &st);
std::string signal_name(int sig);

// Immutable outcome of one subprocess invocation.
class InvocationResult {
public:
  InvocationResult(std::vector<std::string> command, ExitStatus status,
                   std::string out, std::string err)
      : command_(std::move(command)), status_(status), stdout_(std::move(out)),
        stderr_(std::move(err)) {}

  const std::vector<std::string> &command() const { return command_; }
  const ExitStatus &status() const { return status_; }
  const std::string &std_out() const { return stdout_; }
  const std::string &std_err() const { return stderr_; }

  bool exited() const { return std::holds_alternative<Exited>(status_); }
  bool signaled() const { return std::holds_alternative<Signaled>(status_); }
  bool timed_out() const { return std::holds_alternative<TimedOut>(status_); }

  // -1 unless the process exited normally
  int exit_code() const;

  std::string command_string() const;

private:
  std::vector<std::string> command_;
  ExitStatus status_;
  std::string stdout_;
  std::string stderr_;
};

} // namespace gitcli
