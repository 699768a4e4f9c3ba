#include <gitcli/errors.hpp>
#include <gitcli/escaped_path.hpp>
#include <gitcli/status.hpp>
#include <gitcli/util.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace gitcli {

using util::starts_with;

bool StatusEntry::operator==(const StatusEntry &o) const {
  return path == o.path && type == o.type && stage == o.stage &&
         untracked == o.untracked && ignored == o.ignored &&
         mode_index == o.mode_index && sha_index == o.sha_index &&
         mode_repo == o.mode_repo && sha_repo == o.sha_repo &&
         mode_worktree == o.mode_worktree &&
         index_status == o.index_status &&
         worktree_status == o.worktree_status && submodule == o.submodule &&
         orig_path == o.orig_path && score == o.score &&
         stage_modes == o.stage_modes && stage_shas == o.stage_shas;
}

const StatusEntry *StatusReport::find(const std::string &path) const {
  auto it = entries_.find(path);
  return it == entries_.end() ? nullptr : &it->second;
}

std::vector<const StatusEntry *> StatusReport::with_type(const char *t) const {
  std::vector<const StatusEntry *> out;
  for (auto &[p, e] : entries_)
    if (e.type && *e.type == t)
      out.push_back(&e);
  return out;
}

std::vector<const StatusEntry *> StatusReport::changed() const { return with_type("M"); }
std::vector<const StatusEntry *> StatusReport::added() const { return with_type("A"); }
std::vector<const StatusEntry *> StatusReport::deleted() const { return with_type("D"); }

std::vector<const StatusEntry *> StatusReport::untracked() const {
  std::vector<const StatusEntry *> out;
  for (auto &[p, e] : entries_)
    if (e.untracked)
      out.push_back(&e);
  return out;
}

namespace status_parser {

namespace {

struct LineParser {
  const std::string &line;
  size_t index;
  const std::string &output;

  [[noreturn]] void fail(const std::string &why) const {
    throw UnexpectedResultError(why, line, index, output);
  }

  // First n single-space separated fields; `rest` receives the remainder
  // verbatim since paths may contain spaces.
  std::vector<std::string> fields(size_t n, std::string &rest) const {
    std::vector<std::string> out;
    size_t pos = 0;
    while (out.size() < n) {
      size_t sp = line.find(' ', pos);
      if (sp == std::string::npos)
        fail("too few fields in status entry");
      out.push_back(line.substr(pos, sp - pos));
      pos = sp + 1;
    }
    rest = line.substr(pos);
    if (rest.empty())
      fail("missing path in status entry");
    return out;
  }

  void check_xy(const std::string &xy) const {
    if (xy.size() != 2)
      fail("malformed XY field");
  }

  void check_mode(const std::string &m) const {
    if (m.size() != 6)
      fail("malformed mode field");
    for (char c : m)
      if (c < '0' || c > '7')
        fail("malformed mode field");
  }

  void check_sha(const std::string &s) const {
    if (!util::is_hex(s))
      fail("malformed object id");
  }
};

std::optional<std::string> change_type(char x, char y) {
  if (x != '.' && x != ' ')
    return std::string(1, x);
  if (y != '.' && y != ' ')
    return std::string(1, y);
  return std::nullopt;
}

// "1 XY sub mH mI mW hH hI path"
StatusEntry parse_ordinary(const LineParser &p) {
  std::string rest;
  auto f = p.fields(8, rest);
  p.check_xy(f[1]);
  for (int i = 3; i <= 5; ++i)
    p.check_mode(f[i]);
  p.check_sha(f[6]);
  p.check_sha(f[7]);

  StatusEntry e;
  e.path = unquote_path(rest);
  e.index_status = f[1][0];
  e.worktree_status = f[1][1];
  e.type = change_type(e.index_status, e.worktree_status);
  e.stage = "0";
  e.submodule = f[2];
  e.mode_repo = f[3];
  e.mode_index = f[4];
  e.mode_worktree = f[5];
  e.sha_repo = f[6];
  e.sha_index = f[7];
  return e;
}

// "2 XY sub mH mI mW hH hI Xscore path\torigPath"
StatusEntry parse_renamed(const LineParser &p) {
  std::string rest;
  auto f = p.fields(9, rest);
  p.check_xy(f[1]);
  for (int i = 3; i <= 5; ++i)
    p.check_mode(f[i]);
  p.check_sha(f[6]);
  p.check_sha(f[7]);

  const std::string &score = f[8];
  if (score.size() < 2 || (score[0] != 'R' && score[0] != 'C') ||
      !util::all_digits(score.substr(1)))
    p.fail("malformed rename score");

  auto tab = rest.find('\t');
  if (tab == std::string::npos)
    p.fail("rename entry without original path");

  StatusEntry e;
  e.path = unquote_path(rest.substr(0, tab));
  e.orig_path = unquote_path(rest.substr(tab + 1));
  e.score = std::atoi(score.c_str() + 1);
  e.index_status = f[1][0];
  e.worktree_status = f[1][1];
  e.type = change_type(e.index_status, e.worktree_status);
  e.stage = "0";
  e.submodule = f[2];
  e.mode_repo = f[3];
  e.mode_index = f[4];
  e.mode_worktree = f[5];
  e.sha_repo = f[6];
  e.sha_index = f[7];
  return e;
}

// "u XY sub m1 m2 m3 mW h1 h2 h3 path"
StatusEntry parse_unmerged(const LineParser &p) {
  std::string rest;
  auto f = p.fields(10, rest);
  p.check_xy(f[1]);
  for (int i = 3; i <= 6; ++i)
    p.check_mode(f[i]);
  for (int i = 7; i <= 9; ++i)
    p.check_sha(f[i]);

  StatusEntry e;
  e.path = unquote_path(rest);
  e.index_status = f[1][0];
  e.worktree_status = f[1][1];
  e.type = "U";
  e.submodule = f[2];
  e.mode_worktree = f[6];
  e.stage_modes = std::array<std::string, 3>{f[3], f[4], f[5]};
  e.stage_shas = std::array<std::string, 3>{f[7], f[8], f[9]};
  return e;
}

void parse_header(BranchInfo &b, const std::string &line) {
  auto words = util::split_ws(line);
  if (words.size() < 3)
    return;
  const auto &key = words[1];
  const auto &val = words[2];
  if (key == "branch.oid") {
    if (val != "(initial)")
      b.oid = val;
  } else if (key == "branch.head") {
    if (val != "(detached)")
      b.head = val;
  } else if (key == "branch.upstream") {
    b.upstream = val;
  } else if (key == "branch.ab" && words.size() >= 4) {
    b.ahead = std::atoi(val.c_str() + (val[0] == '+' ? 1 : 0));
    b.behind = std::abs(std::atoi(words[3].c_str()));
  } else {
    spdlog::debug("[status] ignoring header '{}'", line);
  }
}

} // namespace

StatusReport parse(const std::string &output) {
  StatusReport::Map entries;
  std::optional<BranchInfo> branch;

  auto lines = util::split_lines(output);
  for (size_t i = 0; i < lines.size(); ++i) {
    const auto &line = lines[i];
    LineParser p{line, i, output};

    if (starts_with(line, "# ")) {
      if (!branch)
        branch.emplace();
      parse_header(*branch, line);
      continue;
    }
    if (line.size() < 3 || line[1] != ' ')
      p.fail("unrecognized status line");

    StatusEntry e;
    switch (line[0]) {
    case '1':
      e = parse_ordinary(p);
      break;
    case '2':
      e = parse_renamed(p);
      break;
    case 'u':
      e = parse_unmerged(p);
      break;
    case '?':
      e.path = unquote_path(line.substr(2));
      e.untracked = true;
      break;
    case '!':
      e.path = unquote_path(line.substr(2));
      e.ignored = true;
      break;
    default:
      p.fail("unrecognized status line");
    }
    auto key = e.path;
    entries[key] = std::move(e);
  }
  return StatusReport(std::move(entries), std::move(branch));
}

} // namespace status_parser
} // namespace gitcli
