#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitcli/errors.hpp>
#include <gitcli/lib.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

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

static Config test_config() {
  Config c;
  c.timeout = std::chrono::duration<double>(30);
  return c;
}

// Repository in a fresh temp dir with one commit of `files`.
using Files = std::vector<std::pair<std::string, std::string>>;

struct TestRepo {
  fs::path dir;
  Lib lib;

  explicit TestRepo(const Files &files)
      : dir(make_tmpdir("gitcli_lib_")),
        lib(RepoPaths{dir / ".git", dir, std::nullopt}, test_config()) {
    lib.command({"init", "-q"});
    lib.command({"config", "user.email", "test@example.com"});
    lib.command({"config", "user.name", "Test"});
    lib.command({"config", "commit.gpgsign", "false"});
    for (auto &[name, content] : files)
      write(name, content);
    lib.command({"add", "-A"});
    lib.command({"commit", "-q", "--allow-empty", "-m", "init"});
  }
  ~TestRepo() {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  void write(const std::string &name, const std::string &content) {
    fs::create_directories((dir / name).parent_path());
    std::ofstream(dir / name, std::ios::binary) << content;
  }
};

TEST_CASE("environment overrides and global options") {
  Lib lib(RepoPaths{fs::path("/r/.git"), std::nullopt, std::nullopt});
  Config cfg;
  auto env = lib.env_overrides(cfg);
  REQUIRE(env == EnvOverrides{{"GIT_DIR", std::string("/r/.git")},
                              {"GIT_WORK_TREE", std::nullopt},
                              {"GIT_INDEX_FILE", std::nullopt},
                              {"GIT_SSH", std::nullopt},
                              {"LC_ALL", std::string("en_US.UTF-8")}});

  cfg.git_ssh = "/usr/bin/ssh-wrapper";
  REQUIRE(lib.env_overrides(cfg)[3].second ==
          std::optional<std::string>("/usr/bin/ssh-wrapper"));

  auto opts = lib.global_opts();
  REQUIRE(opts[0] == "--git-dir=/r/.git");
  REQUIRE(opts[1] == "-c");
  REQUIRE(opts[2] == "core.quotePath=true");
  REQUIRE(std::find(opts.begin(), opts.end(), "color.ui=false") != opts.end());
  for (auto &o : opts)
    REQUIRE(o.rfind("--work-tree", 0) != 0);
}

TEST_CASE("operands that look like options are rejected") {
  REQUIRE_NOTHROW(Lib::assert_args_are_not_options("commit", {"HEAD", "main~1"}));
  try {
    Lib::assert_args_are_not_options("commit or commit range",
                                     {"HEAD", "--output=/tmp/x", "-p"});
    FAIL("expected ArgumentError");
  } catch (const ArgumentError &e) {
    REQUIRE(std::string(e.what()) ==
            "Invalid commit or commit range: '--output=/tmp/x', '-p'");
  }
}

TEST_CASE("argument errors never reach the process runner") {
  Config cfg;
  cfg.binary_path = "/nonexistent/git";
  Lib lib({}, cfg);

  DiffOptions d;
  d.commit1 = "--output=/tmp/pwned";
  REQUIRE_THROWS_AS(lib.diff_raw(d), ArgumentError);

  FsckOptions f;
  f.objects = {"--lost-found"};
  REQUIRE_THROWS_AS(lib.fsck(f), ArgumentError);

  REQUIRE_THROWS_AS(lib.command({}), ArgumentError);
  REQUIRE_THROWS_AS(lib.command({"status"}, {}, ExitPolicy{1, 0}), ArgumentError);
  REQUIRE_THROWS_AS(lib.command({"status"}), ProcessIOError);
}

TEST_CASE("exit policies") {
  REQUIRE(ExitPolicy{}.allows(0));
  REQUIRE_FALSE(ExitPolicy{}.allows(1));
  REQUIRE(Lib::kDiffPolicy.allows(0));
  REQUIRE(Lib::kDiffPolicy.allows(1));
  REQUIRE_FALSE(Lib::kDiffPolicy.allows(2));
  REQUIRE_FALSE(Lib::kDiffPolicy.allows(128));
  REQUIRE(Lib::kFsckPolicy.allows(1));
  REQUIRE_FALSE(Lib::kFsckPolicy.allows(128));
}

TEST_CASE("version strings") {
  REQUIRE(parse_version("git version 2.39.2") == Version{2, 39, 2});
  REQUIRE(parse_version("git version 2.37.1 (Apple Git-137.1)") == Version{2, 37, 1});
  REQUIRE(parse_version("git version 2.40.0.windows.1") == Version{2, 40, 0});
  REQUIRE(parse_version("git version 2.45") == Version{2, 45, 0});
  REQUIRE_THROWS_AS(parse_version("hello"), UnexpectedResultError);
  REQUIRE_THROWS_AS(parse_version(""), UnexpectedResultError);
  REQUIRE(Version{2, 28, 0} >= Lib::kRequiredVersion);
  REQUIRE(Version{2, 27, 9} < Lib::kRequiredVersion);
  REQUIRE(Version{2, 39, 5}.to_string() == "2.39.5");
}

TEST_CASE("git integration: version") {
  if (!has_git()) {
    WARN("git not available");
    return;
  }
  Lib lib({}, test_config());
  auto v = lib.version();
  REQUIRE(v.major >= 2);
  REQUIRE(lib.version() == v);
  REQUIRE(lib.meets_required_version() == (v >= Lib::kRequiredVersion));
}

TEST_CASE("git integration: pure rename") {
  if (!has_git()) {
    WARN("git not available");
    return;
  }
  TestRepo repo(Files{{"a.txt", "same content\n"}});
  repo.lib.command({"mv", "a.txt", "b.txt"});

  DiffOptions o;
  o.cached = true;
  o.find_renames = true;
  auto r = repo.lib.diff_raw(o);
  REQUIRE(r.files_changed() == 1);
  auto &e = r.entries()[0];
  REQUIRE(e.renamed());
  REQUIRE(e.similarity == std::optional<int>(100));
  REQUIRE(e.src_path == std::optional<std::string>("a.txt"));
  REQUIRE(e.path == "b.txt");
  REQUIRE(e.insertions == 0);
  REQUIRE(e.deletions == 0);

  auto st = repo.lib.status();
  auto *se = st.find("b.txt");
  REQUIRE(se);
  REQUIRE(se->type == std::optional<std::string>("R"));
  REQUIRE(se->orig_path == std::optional<std::string>("a.txt"));
}

TEST_CASE("git integration: non-ASCII file name") {
  if (!has_git()) {
    WARN("git not available");
    return;
  }
  TestRepo repo(Files{{"README", "hi\n"}});
  const std::string name = "file\xE2\x98\xA0skull.rb";
  repo.write(name, "puts 1\n");
  repo.lib.command({"add", "--", name});

  DiffOptions o;
  o.cached = true;
  auto r = repo.lib.diff_raw(o);
  REQUIRE(r.files_changed() == 1);
  auto &e = r.entries()[0];
  REQUIRE(e.added());
  REQUIRE_FALSE(e.src);
  REQUIRE(e.dst->path == name);
  REQUIRE(e.insertions == 1);

  auto n = repo.lib.diff_numstat(o);
  REQUIRE(n.entries()[0].path == name);

  auto p = repo.lib.diff_patch(o);
  REQUIRE(p.entries()[0].path == name);
}

TEST_CASE("git integration: type change in raw and patch form") {
  if (!has_git()) {
    WARN("git not available");
    return;
  }
  TestRepo repo(Files{{"link", "x\n"}});
  fs::remove(repo.dir / "link");
  fs::create_symlink("target", repo.dir / "link");

  auto raw = repo.lib.diff_raw();
  REQUIRE(raw.files_changed() == 1);
  REQUIRE(raw.entries()[0].type_changed());
  REQUIRE(raw.entries()[0].src->mode == "100644");
  REQUIRE(raw.entries()[0].dst->mode == "120000");

  auto patch = repo.lib.diff_patch();
  REQUIRE(patch.files_changed() == 2);
  REQUIRE(patch.entries()[0].deleted());
  REQUIRE(patch.entries()[0].src->mode == "100644");
  REQUIRE(patch.entries()[1].added());
  REQUIRE(patch.entries()[1].dst->mode == "120000");
}

TEST_CASE("git integration: diff totals, pathspecs and dirstat") {
  if (!has_git()) {
    WARN("git not available");
    return;
  }
  TestRepo repo(Files{{"src/a.c", "1\n2\n3\n"}, {"docs/b.md", "x\n"}});
  repo.write("src/a.c", "1\nTWO\n3\n4\n");
  repo.write("docs/b.md", "y\n");

  DiffOptions all;
  all.dirstat = "";
  auto r = repo.lib.diff_raw(all);
  REQUIRE(r.files_changed() == 2);
  REQUIRE(r.total_insertions() == 3);
  REQUIRE(r.total_deletions() == 2);
  REQUIRE(r.dirstat());
  REQUIRE_FALSE(r.dirstat()->empty());
  for (auto &d : r.dirstat()->entries())
    REQUIRE(d.directory.back() == '/');

  DiffOptions only_docs;
  only_docs.pathspecs = {"docs"};
  auto d = repo.lib.diff_raw(only_docs);
  REQUIRE(d.files_changed() == 1);
  REQUIRE(d.entries()[0].path == "docs/b.md");
}

TEST_CASE("git integration: exit codes") {
  if (!has_git()) {
    WARN("git not available");
    return;
  }
  TestRepo repo(Files{{"f", "1\n"}});
  repo.write("f", "2\n");

  // 1 means "differences found" under the diff policy
  auto r = repo.lib.command({"diff", "--exit-code", "--quiet"}, {}, Lib::kDiffPolicy);
  REQUIRE(r.exit_code() == 1);
  REQUIRE_THROWS_AS(repo.lib.command({"diff", "--exit-code", "--quiet"}), FailedError);

  DiffOptions bad;
  bad.commit1 = "no-such-rev";
  try {
    repo.lib.diff_raw(bad);
    FAIL("expected FailedError");
  } catch (const FailedError &e) {
    REQUIRE(e.result().exit_code() == 128);
    std::string msg = e.what();
    REQUIRE(msg.find("status: exit 128") != std::string::npos);
    REQUIRE(msg.find("no-such-rev") != std::string::npos);
  }
}

TEST_CASE("git integration: status after stage then delete") {
  if (!has_git()) {
    WARN("git not available");
    return;
  }
  TestRepo repo(Files{{"kept", "k\n"}});
  repo.write("new.txt", "n\n");
  repo.lib.command({"add", "new.txt"});
  fs::remove(repo.dir / "new.txt");
  repo.write("untracked dir/file one.txt", "u\n");

  auto st = repo.lib.status();
  REQUIRE(st.branch());
  auto *e = st.find("new.txt");
  REQUIRE(e);
  REQUIRE(e->type == std::optional<std::string>("A"));
  REQUIRE(e->worktree_status == 'D');
  REQUIRE(e->mode_repo == std::optional<std::string>("000000"));
  REQUIRE(e->mode_worktree == std::optional<std::string>("000000"));

  auto *u = st.find("untracked dir/file one.txt");
  REQUIRE(u);
  REQUIRE(u->untracked);

  StatusOptions only;
  only.pathspecs = {"kept"};
  REQUIRE(repo.lib.status(only).empty());
}

TEST_CASE("git integration: fsck") {
  if (!has_git()) {
    WARN("git not available");
    return;
  }
  TestRepo repo(Files{{"f", "1\n"}});
  REQUIRE_FALSE(repo.lib.fsck().any_issues());

  RunOptions in;
  in.input = std::string("dangling content\n");
  auto sha = repo.lib.command({"hash-object", "-w", "--stdin"}, in).std_out();
  REQUIRE(sha.size() == 40);

  auto r = repo.lib.fsck();
  REQUIRE(r.any_issues());
  REQUIRE(r.dangling.size() == 1);
  REQUIRE(r.dangling[0].type == ObjectType::Blob);
  REQUIRE(r.dangling[0].sha == sha);

  FsckOptions no_dangling;
  no_dangling.dangling = false;
  REQUIRE(repo.lib.fsck(no_dangling).dangling.empty());
}

TEST_CASE("git integration: global config is read at call time") {
  if (!has_git()) {
    WARN("git not available");
    return;
  }
  auto saved = Config::global();
  Lib lib;

  Config broken;
  broken.binary_path = "/nonexistent/git";
  Config::set_global(broken);
  REQUIRE_THROWS_AS(lib.command({"--version"}), ProcessIOError);

  Config::set_global(saved);
  REQUIRE(lib.command({"--version"}).std_out().rfind("git version", 0) == 0);
}
