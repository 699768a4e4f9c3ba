#include <gitcli/app.hpp>
#include <gitcli/cli.hpp>
#include <gitcli/config.hpp>
#include <gitcli/errors.hpp>
#include <gitcli/lib.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <type_traits>

namespace gitcli {

static void print_help(std::ostream &os) {
  os << R"(gitcli-tool - typed git output

Usage:
  gitcli-tool [--git-dir D] [--work-tree W] [--timeout S] [--config F] [--verbose]
              <command> [args]

Commands:
  diff [--patch|--numstat] [--cached] [-M] [--dirstat[=opts]] [rev [rev]] [-- pathspec...]
  status [--ignored] [pathspec...]
  fsck [--unreachable] [--name-objects] [--root] [--tags] [--strict] [object...]
  version
)";
}

static void print_diff(std::ostream &os, const DiffResult &d) {
  for (auto &e : d.entries()) {
    std::string name = e.src_path ? fmt::format("{} -> {}", *e.src_path, e.path)
                                  : e.path;
    if (e.similarity)
      name += fmt::format(" ({}%)", *e.similarity);
    if (e.binary)
      os << fmt::format("{:<12} {}  binary\n", to_string(e.status), name);
    else
      os << fmt::format("{:<12} {}  +{} -{}\n", to_string(e.status), name,
                        e.insertions, e.deletions);
  }
  os << fmt::format("{} files changed, {} insertions(+), {} deletions(-)\n",
                    d.files_changed(), d.total_insertions(),
                    d.total_deletions());
  if (d.dirstat())
    for (auto &s : d.dirstat()->entries())
      os << fmt::format("{:6.1f}% {}\n", s.percent, s.directory);
}

static void print_numstat(std::ostream &os, const NumstatResult &d) {
  for (auto &e : d.entries()) {
    std::string name = e.src_path ? fmt::format("{} -> {}", *e.src_path, e.path)
                                  : e.path;
    if (e.binary)
      os << fmt::format("-\t-\t{}\n", name);
    else
      os << fmt::format("{}\t{}\t{}\n", e.insertions, e.deletions, name);
  }
  os << fmt::format("{} files changed, {} insertions(+), {} deletions(-)\n",
                    d.files_changed(), d.total_insertions(),
                    d.total_deletions());
  if (d.dirstat())
    for (auto &s : d.dirstat()->entries())
      os << fmt::format("{:6.1f}% {}\n", s.percent, s.directory);
}

static void print_status(std::ostream &os, const StatusReport &s) {
  if (auto &b = s.branch()) {
    os << "branch " << b->head.value_or("(detached)");
    if (b->upstream)
      os << fmt::format(" -> {} [+{} -{}]", *b->upstream, b->ahead.value_or(0),
                        b->behind.value_or(0));
    os << "\n";
  }
  for (auto &[path, e] : s.entries()) {
    const char *tag = e.untracked ? "?" : e.ignored ? "!" : nullptr;
    std::string code = tag ? tag : e.type.value_or(".");
    if (e.orig_path)
      os << fmt::format("{} {} <- {}\n", code, path, *e.orig_path);
    else
      os << fmt::format("{} {}\n", code, path);
  }
}

static void print_objects(std::ostream &os, const char *category,
                          const std::vector<FsckObject> &objs) {
  for (auto &o : objs) {
    os << category << ' ';
    if (!o.sha.empty())
      os << to_string(o.type) << ' ' << o.sha;
    if (o.name)
      os << " (" << *o.name << ")";
    if (o.tag_sha)
      os << " in " << *o.tag_sha;
    if (o.message)
      os << (o.sha.empty() ? "" : ": ") << *o.message;
    os << "\n";
  }
}

static void print_fsck(std::ostream &os, const FsckResult &f) {
  print_objects(os, "dangling", f.dangling);
  print_objects(os, "missing", f.missing);
  print_objects(os, "unreachable", f.unreachable);
  print_objects(os, "warning", f.warnings);
  print_objects(os, "root", f.root);
  print_objects(os, "tagged", f.tagged);
  os << (f.any_issues() ? fmt::format("{} issues\n", f.count()) : "no issues\n");
}

static Config build_config(const GlobalOptions &g) {
  Config cfg = g.config ? Config::load(*g.config) : Config{};
  cfg = Config::from_env(cfg);
  if (g.timeout)
    cfg.timeout = parse_seconds(*g.timeout);
  return cfg;
}

static RepoPaths build_paths(const GlobalOptions &g) {
  RepoPaths p;
  if (g.git_dir)
    p.git_dir = *g.git_dir;
  if (g.work_tree)
    p.work_tree = *g.work_tree;
  return p;
}

App::App() : out_(std::cout), err_(std::cerr) {}
App::App(std::ostream &out, std::ostream &err) : out_(out), err_(err) {}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    spdlog::error("{}", pr.error);
    print_help(err_);
    return 2;
  }
  if (pr.global.verbose)
    spdlog::set_level(spdlog::level::debug);

  try {
    Lib lib(build_paths(pr.global), build_config(pr.global));

    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help(out_);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            auto v = lib.version();
            out_ << fmt::format("git {}{}\n", v.to_string(),
                                lib.meets_required_version()
                                    ? ""
                                    : fmt::format(" (older than {})",
                                                  Lib::kRequiredVersion.to_string()));
            return 0;

          } else if constexpr (std::is_same_v<T, CmdDiff>) {
            DiffOptions o;
            if (c.revisions.size() > 0)
              o.commit1 = c.revisions[0];
            if (c.revisions.size() > 1)
              o.commit2 = c.revisions[1];
            o.cached = c.cached;
            o.find_renames = c.find_renames;
            o.dirstat = c.dirstat;
            o.pathspecs = c.pathspecs;
            if (c.numstat)
              print_numstat(out_, lib.diff_numstat(o));
            else
              print_diff(out_, c.patch ? lib.diff_patch(o) : lib.diff_raw(o));
            return 0;

          } else if constexpr (std::is_same_v<T, CmdStatus>) {
            StatusOptions o;
            o.ignored = c.ignored;
            o.pathspecs = c.pathspecs;
            print_status(out_, lib.status(o));
            return 0;

          } else if constexpr (std::is_same_v<T, CmdFsck>) {
            FsckOptions o;
            o.objects = c.objects;
            o.unreachable = c.unreachable;
            o.root = c.root;
            o.tags = c.tags;
            o.strict = c.strict;
            if (c.name_objects)
              o.name_objects = true;
            print_fsck(out_, lib.fsck(o));
            return 0;
          }
        },
        *pr.cmd);
  } catch (const Error &e) {
    spdlog::error("[{}] {}", to_string(e.kind()), e.what());
    switch (e.kind()) {
    case ErrorKind::Argument:
    case ErrorKind::Config:
      return 2;
    default:
      return 1;
    }
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}

} // namespace gitcli
