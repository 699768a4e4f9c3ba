#pragma once
#include "result.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>

namespace gitcli {

enum class ErrorKind {
  Failed,
  Signaled,
  TimedOut,
  ProcessIO,
  Argument,
  UnexpectedResult,
  Config
};

const char *to_string(ErrorKind k);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &msg)
      : std::runtime_error(msg), kind_(kind) {}
  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// Base of the errors raised for a finished (or killed) subprocess.
class CommandLineError : public Error {
public:
  const InvocationResult &result() const { return result_; }

protected:
  CommandLineError(ErrorKind kind, InvocationResult result,
                   const std::string &msg)
      : Error(kind, msg), result_(std::move(result)) {}

  static std::string describe(const InvocationResult &r);

private:
  InvocationResult result_;
};

class FailedError : public CommandLineError {
public:
  explicit FailedError(InvocationResult result);
};

class SignaledError : public CommandLineError {
public:
  explicit SignaledError(InvocationResult result);

protected:
  SignaledError(ErrorKind kind, InvocationResult result,
                const std::string &msg)
      : CommandLineError(kind, std::move(result), msg) {}
};

class TimeoutError : public SignaledError {
public:
  TimeoutError(InvocationResult result, std::chrono::duration<double> timeout);
  std::chrono::duration<double> timeout() const { return timeout_; }

private:
  std::chrono::duration<double> timeout_;
};

// A caller-supplied sink failed (or the process could not be spawned).
class ProcessIOError : public Error {
public:
  ProcessIOError(const std::string &msg, std::exception_ptr cause)
      : Error(ErrorKind::ProcessIO, msg), cause_(std::move(cause)) {}

  std::exception_ptr cause() const { return cause_; }
  void rethrow_cause() const {
    if (cause_)
      std::rethrow_exception(cause_);
  }

private:
  std::exception_ptr cause_;
};

class ArgumentError : public Error {
public:
  explicit ArgumentError(const std::string &msg)
      : Error(ErrorKind::Argument, msg) {}
};

class ConfigError : public Error {
public:
  explicit ConfigError(const std::string &msg)
      : Error(ErrorKind::Config, msg) {}
};

// Tool output did not have the expected shape.
class UnexpectedResultError : public Error {
public:
  UnexpectedResultError(const std::string &reason, std::string line,
                        std::size_t line_index, std::string output);

  const std::string &line() const { return line_; }
  std::size_t line_index() const { return line_index_; }
  const std::string &output() const { return output_; }

private:
  std::string line_;
  std::size_t line_index_;
  std::string output_;
};

// C-style quoting used in messages and logs.
std::string quote(const std::string &s);

} // namespace gitcli
