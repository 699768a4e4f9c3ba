#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace gitcli {

struct Config {
  std::string binary_path = "git";
  // unset or zero: no deadline
  std::optional<std::chrono::duration<double>> timeout;
  std::optional<std::string> git_ssh;
  std::chrono::duration<double> kill_grace{1.0};

  // [core] binary/timeout/ssh/kill_grace
  static Config load(const std::filesystem::path &p);
  static Config load(const std::filesystem::path &p, Config base);
  // GITCLI_BINARY, GITCLI_TIMEOUT, GITCLI_SSH, GITCLI_KILL_GRACE
  static Config from_env();
  static Config from_env(Config base);

  // process-wide default, handed out by value
  static Config global();
  static void set_global(Config c);
};

// Parses a non-negative number of seconds ("2", "0.5"). Throws ArgumentError.
std::chrono::duration<double> parse_seconds(const std::string &s);

} // namespace gitcli
