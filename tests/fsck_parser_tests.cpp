#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitcli/errors.hpp>
#include <gitcli/fsck.hpp>

#include <cctype>

using namespace gitcli;

static const std::string kSha1 = "9d1f3e6d6c7b0b0a6b1a8f2a2c1e5a3b4c5d6e7f";
static const std::string kSha2 = "0123456789abcdef0123456789abcdef01234567";
static const std::string kSha3 = "fedcba9876543210fedcba9876543210fedcba98";

TEST_CASE("dangling commit with an object name") {
  auto r = fsck_parser::parse("dangling commit " + kSha1 + " (HEAD~2^2:src/)");
  REQUIRE(r.dangling.size() == 1);
  auto &o = r.dangling[0];
  REQUIRE(o.type == ObjectType::Commit);
  REQUIRE(o.sha == kSha1);
  REQUIRE(o.name == std::optional<std::string>("HEAD~2^2:src/"));
  REQUIRE_FALSE(o.message);
  REQUIRE(r.any_issues());
}

TEST_CASE("every category") {
  const std::string out =
      "dangling blob " + kSha1 + "\n"
      "missing tree " + kSha2 + "\n"
      "unreachable commit " + kSha3 + " (refs/stash@{0})\n"
      "root " + kSha1 + "\n"
      "tagged commit " + kSha2 + " (v1.0) in " + kSha3 + "\n"
      "warning in tree " + kSha3 + ": hasDot: contains '.'\n"
      "warning: reflog of 'HEAD' references pruned commits\n";
  auto r = fsck_parser::parse(out);

  REQUIRE(r.dangling.size() == 1);
  REQUIRE(r.dangling[0].type == ObjectType::Blob);
  REQUIRE(r.missing[0].type == ObjectType::Tree);
  REQUIRE(r.unreachable[0].name == std::optional<std::string>("refs/stash@{0}"));

  REQUIRE(r.root.size() == 1);
  REQUIRE(r.root[0].type == ObjectType::Commit);
  REQUIRE(r.root[0].sha == kSha1);

  REQUIRE(r.tagged.size() == 1);
  REQUIRE(r.tagged[0].sha == kSha2);
  REQUIRE(r.tagged[0].name == std::optional<std::string>("v1.0"));
  REQUIRE(r.tagged[0].tag_sha == std::optional<std::string>(kSha3));

  REQUIRE(r.warnings.size() == 2);
  REQUIRE(r.warnings[0].type == ObjectType::Tree);
  REQUIRE(r.warnings[0].message == std::optional<std::string>("hasDot: contains '.'"));
  REQUIRE(r.warnings[1].sha.empty());
  REQUIRE(r.warnings[1].message ==
          std::optional<std::string>("reflog of 'HEAD' references pruned commits"));

  REQUIRE(r.any_issues());
  REQUIRE(r.count() == 5);
  REQUIRE(r.all_objects().size() == 5);
  REQUIRE(r.all_objects()[0].sha == kSha1);
}

TEST_CASE("root and tagged alone are not issues") {
  auto r = fsck_parser::parse("root commit " + kSha1 + "\ntagged tag " + kSha2 +
                              " (v2) in " + kSha3);
  REQUIRE(r.root[0].type == ObjectType::Commit);
  REQUIRE(r.tagged[0].type == ObjectType::Tag);
  REQUIRE_FALSE(r.any_issues());
  REQUIRE(r.empty());
  REQUIRE(r.count() == 0);
}

TEST_CASE("clean and chatty reports") {
  REQUIRE(fsck_parser::parse("").empty());
  auto r = fsck_parser::parse("notice: HEAD points to an unborn branch (master)\n"
                              "Checking object directories\n");
  REQUIRE(r.empty());
}

TEST_CASE("malformed lines raise UnexpectedResultError") {
  SECTION("unknown type") {
    REQUIRE_THROWS_AS(fsck_parser::parse("dangling widget " + kSha1),
                      UnexpectedResultError);
  }
  SECTION("short object id") {
    try {
      fsck_parser::parse("dangling blob " + kSha1 + "\ndangling blob abc123");
      FAIL("expected UnexpectedResultError");
    } catch (const UnexpectedResultError &e) {
      REQUIRE(e.line_index() == 1);
    }
  }
  SECTION("upper case object id") {
    std::string upper = kSha2;
    for (auto &c : upper)
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    REQUIRE_THROWS_AS(fsck_parser::parse("missing blob " + upper),
                      UnexpectedResultError);
  }
  SECTION("unterminated name") {
    REQUIRE_THROWS_AS(fsck_parser::parse("missing blob " + kSha1 + " (HEAD:x"),
                      UnexpectedResultError);
  }
  SECTION("tagged without target") {
    REQUIRE_THROWS_AS(fsck_parser::parse("tagged commit " + kSha1 + " (v1)"),
                      UnexpectedResultError);
  }
  SECTION("warning without message") {
    REQUIRE_THROWS_AS(fsck_parser::parse("warning in blob " + kSha1),
                      UnexpectedResultError);
  }
}

TEST_CASE("fsck parsing is idempotent") {
  const std::string out = "dangling blob " + kSha1 + "\nroot " + kSha2;
  REQUIRE(fsck_parser::parse(out) == fsck_parser::parse(out));
}
