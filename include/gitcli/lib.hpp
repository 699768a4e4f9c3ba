#pragma once
#include "command_line.hpp"
#include "config.hpp"
#include "diff.hpp"
#include "fsck.hpp"
#include "status.hpp"

#include <array>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace gitcli {

struct RepoPaths {
  std::optional<std::filesystem::path> git_dir;
  std::optional<std::filesystem::path> work_tree;
  std::optional<std::filesystem::path> index_file;
};

// Allowed exit-code range, inclusive.
struct ExitPolicy {
  int min = 0;
  int max = 0;
  bool allows(int code) const { return code >= min && code <= max; }
};

struct Version {
  int major = 0;
  int minor = 0;
  int patch = 0;

  std::array<int, 3> parts() const { return {major, minor, patch}; }
  bool operator<(const Version &o) const { return parts() < o.parts(); }
  bool operator>=(const Version &o) const { return !(*this < o); }
  bool operator==(const Version &o) const { return parts() == o.parts(); }
  std::string to_string() const;
};

// "git version 2.39.2[.extra] [(vendor)]"
Version parse_version(const std::string &output);

struct DiffOptions {
  std::optional<std::string> commit1;
  std::optional<std::string> commit2;
  bool cached = false;
  bool merge_base = false;
  bool find_renames = false;
  bool find_copies = false;
  // nullopt: off; "": --dirstat; otherwise --dirstat=<value>
  std::optional<std::string> dirstat;
  std::vector<std::string> pathspecs;
  std::optional<std::chrono::duration<double>> timeout;
};

struct StatusOptions {
  bool ignored = false;
  std::vector<std::string> pathspecs;
  std::optional<std::chrono::duration<double>> timeout;
};

struct FsckOptions {
  bool tags = false;
  bool root = false;
  bool unreachable = false;
  bool strict = false;
  bool connectivity_only = false;
  bool no_reflogs = false;
  // nullopt leaves git's default; false adds --no-<flag>
  std::optional<bool> full;
  std::optional<bool> dangling;
  std::optional<bool> name_objects;
  std::optional<bool> references;
  std::vector<std::string> objects;
  std::optional<std::chrono::duration<double>> timeout;
};

// Builds git argument vectors, runs them through CommandLine and hands the
// output to the matching parser.
class Lib {
public:
  static constexpr Version kRequiredVersion{2, 28, 0};
  static constexpr ExitPolicy kDiffPolicy{0, 1};
  static constexpr ExitPolicy kFsckPolicy{0, 1};

  explicit Lib(RepoPaths paths = {}, std::optional<Config> config = std::nullopt,
               std::shared_ptr<spdlog::logger> logger = nullptr);

  const RepoPaths &paths() const { return paths_; }

  EnvOverrides env_overrides(const Config &cfg) const;
  std::vector<std::string> global_opts() const;

  // Throws FailedError when the exit code falls outside `policy`.
  InvocationResult command(const std::vector<std::string> &args,
                           RunOptions opts = {}, ExitPolicy policy = {}) const;

  Version version() const;
  bool meets_required_version() const;

  DiffResult diff_raw(const DiffOptions &opts = {}) const;
  DiffResult diff_patch(const DiffOptions &opts = {}) const;
  NumstatResult diff_numstat(const DiffOptions &opts = {}) const;
  StatusReport status(const StatusOptions &opts = {}) const;
  FsckResult fsck(const FsckOptions &opts = {}) const;

  static void assert_args_are_not_options(const std::string &what,
                                          const std::vector<std::string> &args);

private:
  Config snapshot() const;
  std::vector<std::string> diff_args(std::vector<std::string> head,
                                     const DiffOptions &opts) const;

  RepoPaths paths_;
  std::optional<Config> config_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex version_mu_;
  mutable std::optional<Version> version_;
};

} // namespace gitcli
