#include <gitcli/diff_parser.hpp>
#include <gitcli/errors.hpp>
#include <gitcli/lib.hpp>
#include <gitcli/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gitcli {

static const std::vector<std::string> kStaticGlobalOpts = {
    "-c", "core.quotePath=true",  "-c", "color.ui=false",
    "-c", "color.advice=false",   "-c", "color.diff=false",
    "-c", "color.grep=false",     "-c", "color.push=false",
    "-c", "color.remote=false",   "-c", "color.showBranch=false",
    "-c", "color.status=false",   "-c", "color.transport=false",
};

static std::optional<std::string>
path_value(const std::optional<std::filesystem::path> &p) {
  if (!p)
    return std::nullopt;
  return p->string();
}

std::string Version::to_string() const {
  return fmt::format("{}.{}.{}", major, minor, patch);
}

Version parse_version(const std::string &output) {
  auto lines = util::split_lines(output);
  if (lines.empty())
    throw UnexpectedResultError("empty version output", "", 0, output);
  auto words = util::split_ws(lines[0]);
  if (words.size() < 3 || words[0] != "git" || words[1] != "version")
    throw UnexpectedResultError("unrecognized version line", lines[0], 0,
                                output);

  auto parts = util::split(words[2], '.');
  Version v;
  int *fields[] = {&v.major, &v.minor, &v.patch};
  size_t n = 0;
  for (; n < parts.size() && n < 3; ++n) {
    if (!util::all_digits(parts[n]))
      break;
    *fields[n] = std::stoi(parts[n]);
  }
  if (n < 2)
    throw UnexpectedResultError("unrecognized version number", lines[0], 0,
                                output);
  return v;
}

Lib::Lib(RepoPaths paths, std::optional<Config> config,
         std::shared_ptr<spdlog::logger> logger)
    : paths_(std::move(paths)), config_(std::move(config)),
      logger_(std::move(logger)) {}

Config Lib::snapshot() const { return config_ ? *config_ : Config::global(); }

EnvOverrides Lib::env_overrides(const Config &cfg) const {
  return {
      {"GIT_DIR", path_value(paths_.git_dir)},
      {"GIT_WORK_TREE", path_value(paths_.work_tree)},
      {"GIT_INDEX_FILE", path_value(paths_.index_file)},
      {"GIT_SSH", cfg.git_ssh},
      {"LC_ALL", std::string("en_US.UTF-8")},
  };
}

std::vector<std::string> Lib::global_opts() const {
  std::vector<std::string> opts;
  if (paths_.git_dir)
    opts.push_back("--git-dir=" + paths_.git_dir->string());
  if (paths_.work_tree)
    opts.push_back("--work-tree=" + paths_.work_tree->string());
  opts.insert(opts.end(), kStaticGlobalOpts.begin(), kStaticGlobalOpts.end());
  return opts;
}

void Lib::assert_args_are_not_options(const std::string &what,
                                      const std::vector<std::string> &args) {
  std::vector<std::string> bad;
  for (auto &a : args)
    if (!a.empty() && a[0] == '-')
      bad.push_back(a);
  if (!bad.empty())
    throw ArgumentError(
        fmt::format("Invalid {}: '{}'", what, fmt::join(bad, "', '")));
}

InvocationResult Lib::command(const std::vector<std::string> &args,
                              RunOptions opts, ExitPolicy policy) const {
  if (args.empty())
    throw ArgumentError("no git command given");
  if (policy.min > policy.max)
    throw ArgumentError(fmt::format("empty exit status range {}..{}",
                                    policy.min, policy.max));

  // one snapshot per invocation; later set_global() calls do not leak in
  const Config cfg = snapshot();
  if (!opts.timeout)
    opts.timeout = cfg.timeout;
  opts.kill_grace = cfg.kill_grace;

  CommandLine cl(env_overrides(cfg), cfg.binary_path, global_opts(), logger_);
  auto result = cl.run(args, opts);
  if (!policy.allows(result.exit_code()))
    throw FailedError(std::move(result));
  return result;
}

Version Lib::version() const {
  std::lock_guard<std::mutex> lk(version_mu_);
  if (!version_)
    version_ = parse_version(command({"version"}).std_out());
  return *version_;
}

bool Lib::meets_required_version() const {
  return version() >= kRequiredVersion;
}

std::vector<std::string> Lib::diff_args(std::vector<std::string> head,
                                        const DiffOptions &opts) const {
  std::vector<std::string> revs;
  if (opts.commit1)
    revs.push_back(*opts.commit1);
  if (opts.commit2)
    revs.push_back(*opts.commit2);
  assert_args_are_not_options("commit or commit range", revs);

  auto args = std::move(head);
  if (opts.cached)
    args.push_back("--cached");
  if (opts.merge_base)
    args.push_back("--merge-base");
  if (opts.find_renames)
    args.push_back("-M");
  if (opts.find_copies)
    args.push_back("-C");
  if (opts.dirstat)
    args.push_back(opts.dirstat->empty() ? "--dirstat"
                                         : "--dirstat=" + *opts.dirstat);
  args.insert(args.end(), revs.begin(), revs.end());
  if (!opts.pathspecs.empty()) {
    args.push_back("--");
    args.insert(args.end(), opts.pathspecs.begin(), opts.pathspecs.end());
  }
  return args;
}

static RunOptions with_timeout(
    const std::optional<std::chrono::duration<double>> &timeout) {
  RunOptions ro;
  ro.timeout = timeout;
  return ro;
}

DiffResult Lib::diff_raw(const DiffOptions &opts) const {
  auto args = diff_args({"diff", "--raw", "--numstat", "--shortstat",
                         "--src-prefix=a/", "--dst-prefix=b/"},
                        opts);
  auto r = command(args, with_timeout(opts.timeout), kDiffPolicy);
  return diff_parser::parse_raw(r.std_out(), opts.dirstat.has_value());
}

DiffResult Lib::diff_patch(const DiffOptions &opts) const {
  auto o = opts;
  o.find_renames = false; // already in the static part
  auto args = diff_args({"diff", "--patch", "--numstat", "--shortstat",
                         "--src-prefix=a/", "--dst-prefix=b/", "-M"},
                        o);
  auto r = command(args, with_timeout(opts.timeout), kDiffPolicy);
  return diff_parser::parse_patch(r.std_out(), opts.dirstat.has_value());
}

NumstatResult Lib::diff_numstat(const DiffOptions &opts) const {
  auto o = opts;
  o.find_renames = false;
  auto args = diff_args({"diff", "--numstat", "--shortstat", "-M"}, o);
  auto r = command(args, with_timeout(opts.timeout), kDiffPolicy);
  return diff_parser::parse_numstat(r.std_out(), opts.dirstat.has_value());
}

StatusReport Lib::status(const StatusOptions &opts) const {
  std::vector<std::string> args = {"status", "--porcelain=v2",
                                   "--untracked-files=all", "--branch"};
  if (opts.ignored)
    args.push_back("--ignored");
  if (!opts.pathspecs.empty()) {
    args.push_back("--");
    args.insert(args.end(), opts.pathspecs.begin(), opts.pathspecs.end());
  }
  auto r = command(args, with_timeout(opts.timeout));
  return status_parser::parse(r.std_out());
}

static void negatable(std::vector<std::string> &args, const char *flag,
                      const std::optional<bool> &v) {
  if (!v)
    return;
  args.push_back(*v ? fmt::format("--{}", flag) : fmt::format("--no-{}", flag));
}

FsckResult Lib::fsck(const FsckOptions &opts) const {
  assert_args_are_not_options("object", opts.objects);

  std::vector<std::string> args = {"fsck", "--no-progress"};
  if (opts.tags)
    args.push_back("--tags");
  if (opts.root)
    args.push_back("--root");
  if (opts.unreachable)
    args.push_back("--unreachable");
  if (opts.no_reflogs)
    args.push_back("--no-reflogs");
  negatable(args, "full", opts.full);
  if (opts.strict)
    args.push_back("--strict");
  negatable(args, "dangling", opts.dangling);
  if (opts.connectivity_only)
    args.push_back("--connectivity-only");
  negatable(args, "name-objects", opts.name_objects);
  negatable(args, "references", opts.references);
  args.insert(args.end(), opts.objects.begin(), opts.objects.end());

  auto r = command(args, with_timeout(opts.timeout), kFsckPolicy);
  // object warnings are printed on stderr
  std::string report = r.std_out();
  if (!r.std_err().empty()) {
    if (!report.empty())
      report += '\n';
    report += r.std_err();
  }
  return fsck_parser::parse(report);
}

} // namespace gitcli
