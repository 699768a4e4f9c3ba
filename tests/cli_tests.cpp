#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitcli/app.hpp>
#include <gitcli/cli.hpp>
#include <gitcli/command_line.hpp>
#include <gitcli/errors.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace gitcli;
namespace fs = std::filesystem;

static fs::path make_tmpdir(const std::string &prefix) {
  fs::path base = fs::temp_directory_path() / (prefix + "XXXXXX");
  std::string s = base.string();
  std::vector<char> buf(s.begin(), s.end());
  buf.push_back('\0');
  char *p = mkdtemp(buf.data());
  REQUIRE(p != nullptr);
  return fs::path(p);
}

static bool has_git() {
  try {
    return CommandLine({}, "git").run({"--version"}).exit_code() == 0;
  } catch (const Error &) {
    return false;
  }
}

static int run_app(std::vector<std::string> args, std::string *out = nullptr) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);
  std::ostringstream o, e;
  int rc = App(o, e).run((int)args.size(), argv.data());
  if (out)
    *out = o.str();
  return rc;
}

TEST_CASE("no arguments shows help") {
  auto pr = parse_cli(std::vector<std::string>{});
  REQUIRE(pr.cmd);
  REQUIRE(std::holds_alternative<CmdHelp>(*pr.cmd));
}

TEST_CASE("global options and diff operands") {
  auto pr = parse_cli({"--git-dir", "/x/.git", "--work-tree", "/x", "--timeout",
                       "2", "--verbose", "diff", "--cached", "-M", "HEAD~1",
                       "--", "a", "--b"});
  REQUIRE(pr.error.empty());
  REQUIRE(pr.global.git_dir == std::optional<std::string>("/x/.git"));
  REQUIRE(pr.global.work_tree == std::optional<std::string>("/x"));
  REQUIRE(pr.global.timeout == std::optional<std::string>("2"));
  REQUIRE(pr.global.verbose);
  auto &d = std::get<CmdDiff>(*pr.cmd);
  REQUIRE(d.cached);
  REQUIRE(d.find_renames);
  REQUIRE(d.revisions == std::vector<std::string>{"HEAD~1"});
  // after "--" everything is a pathspec, even dashed names
  REQUIRE(d.pathspecs == std::vector<std::string>{"a", "--b"});
}

TEST_CASE("diff flags") {
  auto pr = parse_cli({"diff", "--dirstat=files", "--numstat"});
  auto &d = std::get<CmdDiff>(*pr.cmd);
  REQUIRE(d.dirstat == std::optional<std::string>("files"));
  REQUIRE(d.numstat);

  REQUIRE_FALSE(parse_cli({"diff", "--patch", "--numstat"}).cmd);
  REQUIRE_FALSE(parse_cli({"diff", "a", "b", "c"}).cmd);
  auto bad = parse_cli({"diff", "--output=x"});
  REQUIRE_FALSE(bad.cmd);
  REQUIRE(bad.error.find("unknown option") != std::string::npos);
}

TEST_CASE("status and fsck") {
  auto st = parse_cli({"status", "--ignored", "src", "--", "docs"});
  auto &s = std::get<CmdStatus>(*st.cmd);
  REQUIRE(s.ignored);
  REQUIRE(s.pathspecs == std::vector<std::string>{"src", "docs"});

  auto fk = parse_cli({"fsck", "--unreachable", "--name-objects", "abc123"});
  auto &f = std::get<CmdFsck>(*fk.cmd);
  REQUIRE(f.unreachable);
  REQUIRE(f.name_objects);
  REQUIRE(f.objects == std::vector<std::string>{"abc123"});
  REQUIRE_FALSE(parse_cli({"fsck", "--", "path"}).cmd);
}

TEST_CASE("usage errors") {
  REQUIRE_FALSE(parse_cli({"frobnicate"}).cmd);
  REQUIRE_FALSE(parse_cli({"--timeout"}).cmd);
  REQUIRE_FALSE(parse_cli({"version", "extra"}).cmd);
  REQUIRE(std::holds_alternative<CmdVersion>(*parse_cli({"version"}).cmd));

  REQUIRE(run_app({"gitcli-tool", "frobnicate"}) == 2);
  REQUIRE(run_app({"gitcli-tool", "--timeout", "soon", "version"}) == 2);
  REQUIRE(run_app({"gitcli-tool", "--help"}) == 0);
}

TEST_CASE("bad config file is a usage error") {
  auto dir = make_tmpdir("gitcli_cli_");
  std::ofstream(dir / "bad.conf") << "[core]\nnot a pair\n";
  REQUIRE(run_app({"gitcli-tool", "--config", (dir / "bad.conf").string(),
                   "version"}) == 2);
  fs::remove_all(dir);
}

TEST_CASE("tool runs against a repository") {
  if (!has_git()) {
    WARN("git not available");
    return;
  }
  auto dir = make_tmpdir("gitcli_cli_");
  auto git_dir = (dir / ".git").string();
  std::vector<std::string> base = {"gitcli-tool", "--git-dir", git_dir,
                                   "--work-tree", dir.string()};

  CommandLine git({}, "git", {"--git-dir=" + git_dir, "--work-tree=" + dir.string()});
  git.run({"init", "-q"});
  std::ofstream(dir / "tracked.txt") << "one\n";
  git.run({"add", "tracked.txt"});
  git.run({"-c", "user.email=t@example.com", "-c", "user.name=T", "-c",
           "commit.gpgsign=false", "commit", "-q", "-m", "init"});
  std::ofstream(dir / "tracked.txt") << "two\n";
  std::ofstream(dir / "extra.txt") << "x\n";

  auto with = [&](std::vector<std::string> more) {
    auto v = base;
    v.insert(v.end(), more.begin(), more.end());
    return v;
  };

  std::string out;
  REQUIRE(run_app(with({"status"}), &out) == 0);
  REQUIRE(out.find("M tracked.txt") != std::string::npos);
  REQUIRE(out.find("? extra.txt") != std::string::npos);

  REQUIRE(run_app(with({"diff"}), &out) == 0);
  REQUIRE(out.find("modified") != std::string::npos);
  REQUIRE(out.find("1 files changed, 1 insertions(+), 1 deletions(-)") !=
          std::string::npos);

  REQUIRE(run_app(with({"diff", "--numstat"}), &out) == 0);
  REQUIRE(out.find("1\t1\ttracked.txt") != std::string::npos);

  REQUIRE(run_app(with({"fsck"}), &out) == 0);
  REQUIRE(out.find("no issues") != std::string::npos);

  REQUIRE(run_app(with({"version"}), &out) == 0);
  REQUIRE(out.rfind("git ", 0) == 0);

  // git exits 128 for an unknown revision
  REQUIRE(run_app(with({"diff", "no-such-rev"})) == 1);

  fs::remove_all(dir);
}
