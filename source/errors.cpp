#include <gitcli/errors.hpp>

#include <fmt/format.h>

namespace gitcli {

const char *to_string(ErrorKind k) {
  switch (k) {
  case ErrorKind::Failed: return "failed";
  case ErrorKind::Signaled: return "signaled";
  case ErrorKind::TimedOut: return "timed_out";
  case ErrorKind::ProcessIO: return "process_io";
  case ErrorKind::Argument: return "argument";
  case ErrorKind::UnexpectedResult: return "unexpected_result";
  case ErrorKind::Config: return "config";
  }
  return "unknown";
}

std::string quote(const std::string &s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (unsigned char c : s) {
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\n': out += "\\n"; break;
    case '\t': out += "\\t"; break;
    case '\r': out += "\\r"; break;
    case 0x1b: out += "\\e"; break;
    default:
      if (c < 0x20 || c == 0x7f)
        out += fmt::format("\\x{:02X}", c);
      else
        out.push_back(static_cast<char>(c));
    }
  }
  out.push_back('"');
  return out;
}

std::string CommandLineError::describe(const InvocationResult &r) {
  return fmt::format("{}, status: {}, stderr: {}", r.command_string(),
                     to_string(r.status()), quote(r.std_err()));
}

FailedError::FailedError(InvocationResult result)
    : CommandLineError(ErrorKind::Failed, result, describe(result)) {}

SignaledError::SignaledError(InvocationResult result)
    : CommandLineError(ErrorKind::Signaled, result, describe(result)) {}

TimeoutError::TimeoutError(InvocationResult result,
                           std::chrono::duration<double> timeout)
    : SignaledError(ErrorKind::TimedOut, result,
                    fmt::format("{}, timed out after {}s", describe(result),
                                timeout.count())),
      timeout_(timeout) {}

UnexpectedResultError::UnexpectedResultError(const std::string &reason,
                                             std::string line,
                                             std::size_t line_index,
                                             std::string output)
    : Error(ErrorKind::UnexpectedResult,
            fmt::format("{} at line {}: {}", reason, line_index, quote(line))),
      line_(std::move(line)), line_index_(line_index),
      output_(std::move(output)) {}

} // namespace gitcli
