#include <gitcli/result.hpp>

#include <fmt/format.h>

#include <csignal>
#include <cstring>

namespace gitcli {

std::string signal_name(int sig) {
  switch (sig) {
  case SIGHUP: return "SIGHUP";
  case SIGINT: return "SIGINT";
  case SIGQUIT: return "SIGQUIT";
  case SIGABRT: return "SIGABRT";
  case SIGKILL: return "SIGKILL";
  case SIGSEGV: return "SIGSEGV";
  case SIGPIPE: return "SIGPIPE";
  case SIGALRM: return "SIGALRM";
  case SIGTERM: return "SIGTERM";
  case SIGUSR1: return "SIGUSR1";
  case SIGUSR2: return "SIGUSR2";
  default: break;
  }
  return fmt::format("SIG{}", sig);
}

std::string to_string(const ExitStatus &st) {
  if (auto e = std::get_if<Exited>(&st))
    return fmt::format("exit {}", e->code);
  if (auto s = std::get_if<Signaled>(&st))
    return fmt::format("signal {} ({})", s->signal, signal_name(s->signal));
  auto &t = std::get<TimedOut>(st);
  return fmt::format("timed out after {}s (signal {})", t.after.count(),
                     t.signal_used);
}

int InvocationResult::exit_code() const {
  if (auto e = std::get_if<Exited>(&status_))
    return e->code;
  return -1;
}

std::string InvocationResult::command_string() const {
  return fmt::format("{}", fmt::join(command_, " "));
}

} // namespace gitcli
