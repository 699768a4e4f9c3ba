#pragma once
#include "result.hpp"
#include "sink.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spdlog {
class logger;
}

namespace gitcli {

// Ordered environment overlay; a nullopt value unsets the variable.
using EnvOverrides =
    std::vector<std::pair<std::string, std::optional<std::string>>>;

struct RunOptions {
  // written to the child's stdin; without it stdin is /dev/null
  std::optional<std::string> input;
  // streamed copies of stdout/stderr, not owned
  Sink *out = nullptr;
  Sink *err = nullptr;
  // child's stderr goes to the stdout pipe; result stderr is empty
  bool merge = false;
  // unset or zero: wait forever
  std::optional<std::chrono::duration<double>> timeout;
  // SIGTERM -> SIGKILL escalation delay after a timeout
  std::chrono::duration<double> kill_grace{1.0};
  // strip one trailing "\n", "\r\n" or "\r"
  bool chomp = true;
  // re-encode captured bytes from `encoding` to UTF-8
  bool normalize = true;
  std::string encoding = "UTF-8";
  std::filesystem::path chdir;
};

// Spawns one external binary per run(). Exited(code) is returned whatever
// the code; Signaled and TimedOut are thrown as SignaledError/TimeoutError.
// A failing sink or a failed exec throws ProcessIOError.
class CommandLine {
public:
  CommandLine(EnvOverrides env, std::string binary_path,
              std::vector<std::string> global_opts = {},
              std::shared_ptr<spdlog::logger> logger = nullptr);

  InvocationResult run(const std::vector<std::string> &args,
                       const RunOptions &opts = {}) const;

  const EnvOverrides &env() const { return env_; }
  const std::string &binary_path() const { return binary_path_; }
  const std::vector<std::string> &global_opts() const { return global_opts_; }

  // binary + global options + args
  std::vector<std::string> build_command(const std::vector<std::string> &args) const;

  // current environment with the overrides applied, as "K=V" strings
  static std::vector<std::string> merged_environment(const EnvOverrides &env);

private:
  EnvOverrides env_;
  std::string binary_path_;
  std::vector<std::string> global_opts_;
  std::shared_ptr<spdlog::logger> logger_;
};

// Applies RunOptions::normalize/chomp to captured bytes.
std::string post_process(std::string raw, const RunOptions &opts);

} // namespace gitcli
