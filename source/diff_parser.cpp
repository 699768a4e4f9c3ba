#include <gitcli/diff_parser.hpp>
#include <gitcli/errors.hpp>
#include <gitcli/escaped_path.hpp>
#include <gitcli/util.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace gitcli {

using util::starts_with;

static const char *const kNullMode = "000000";

void NumstatMap::add(const NumstatEntry &e) {
  FileStats st{e.insertions, e.deletions, e.binary};
  by_path_[e.path] = st;
  if (e.src_path)
    by_pair_[{*e.src_path, e.path}] = st;
}

std::optional<FileStats> NumstatMap::lookup(const std::string &path) const {
  auto it = by_path_.find(path);
  if (it == by_path_.end())
    return std::nullopt;
  return it->second;
}

std::optional<FileStats> NumstatMap::lookup(const std::string &src_path,
                                            const std::string &path) const {
  auto it = by_pair_.find({src_path, path});
  if (it != by_pair_.end())
    return it->second;
  return lookup(path);
}

namespace diff_parser {

namespace {

[[noreturn]] void fail(const std::string &why, const std::string &line,
                       size_t index, const std::string &output) {
  throw UnexpectedResultError(why, line, index, output);
}

bool is_stat_count(const std::string &s) {
  return s == "-" || util::all_digits(s);
}

bool looks_like_numstat(const std::string &line) {
  auto parts = util::split(line, '\t', 3);
  return parts.size() == 3 && is_stat_count(parts[0]) &&
         is_stat_count(parts[1]) && !parts[2].empty();
}

bool looks_like_dirstat(const std::string &line) {
  auto t = util::trim(line);
  size_t i = 0;
  while (i < t.size() && ((t[i] >= '0' && t[i] <= '9') || t[i] == '.'))
    ++i;
  return i > 0 && i + 1 < t.size() && t[i] == '%' && t[i + 1] == ' ';
}

int to_int(const std::string &s) {
  return static_cast<int>(std::strtol(s.c_str(), nullptr, 10));
}

// Lines of the stat sections that accompany raw or patch output.
struct StatSections {
  std::vector<std::pair<size_t, std::string>> numstat;
  std::optional<std::string> shortstat;
  std::vector<std::string> dirstat;
};

void classify_stat_line(StatSections &s, const std::string &line, size_t index,
                        const std::string &output) {
  if (looks_like_numstat(line))
    s.numstat.emplace_back(index, line);
  else if (!s.shortstat && parse_shortstat(line))
    s.shortstat = line;
  else if (looks_like_dirstat(line))
    s.dirstat.push_back(line);
  else
    fail("unexpected line in diff output", line, index, output);
}

NumstatMap build_numstat_map(const StatSections &s, const std::string &output) {
  NumstatMap m;
  for (auto &[idx, line] : s.numstat)
    m.add(parse_numstat_line(line, idx, output));
  return m;
}

void apply_stats(DiffEntry &e, const std::optional<FileStats> &st) {
  if (st) {
    e.insertions = st->insertions;
    e.deletions = st->deletions;
    e.binary = e.binary || st->binary;
  }
  if (e.binary) {
    e.insertions = 0;
    e.deletions = 0;
  }
}

void lookup_stats(DiffEntry &e, const NumstatMap &m) {
  if (e.src_path)
    apply_stats(e, m.lookup(*e.src_path, e.path));
  else
    apply_stats(e, m.lookup(e.path));
}

// ":100644 100644 abc1234 def5678 M\tpath"
// ":100644 100644 abc1234 def5678 R086\told\tnew"
DiffEntry parse_raw_line(const std::string &line, size_t index,
                         const std::string &output, const NumstatMap &stats) {
  auto fields = util::split(line, '\t');
  if (fields.size() < 2 || fields[0].size() < 2)
    fail("malformed raw diff record", line, index, output);

  auto head = util::split_ws(std::string_view(fields[0]).substr(1));
  if (head.size() != 5)
    fail("malformed raw diff record header", line, index, output);

  const std::string &mode_src = head[0];
  const std::string &mode_dst = head[1];
  const std::string &status = head[4];
  const std::string score = status.substr(1);

  DiffEntry e;
  size_t expected_paths = 1;
  switch (status[0]) {
  case 'M': e.status = DiffStatus::Modified; break;
  case 'A': e.status = DiffStatus::Added; break;
  case 'D': e.status = DiffStatus::Deleted; break;
  case 'T': e.status = DiffStatus::TypeChanged; break;
  case 'U': e.status = DiffStatus::Unmerged; break;
  case 'R':
    e.status = DiffStatus::Renamed;
    expected_paths = 2;
    break;
  case 'C':
    e.status = DiffStatus::Copied;
    expected_paths = 2;
    break;
  default:
    fail("unknown diff status '" + status + "'", line, index, output);
  }

  if (fields.size() != expected_paths + 1)
    fail("wrong number of paths for status '" + status + "'", line, index,
         output);

  if (e.renamed() || e.copied()) {
    if (!util::all_digits(score))
      fail("missing similarity score", line, index, output);
    int sim = to_int(score);
    if (sim < 1 || sim > 100)
      fail("similarity out of range", line, index, output);
    e.similarity = sim;
  }

  std::string src_path = unquote_path(fields[1]);
  e.path = expected_paths == 2 ? unquote_path(fields[2]) : src_path;
  if (expected_paths == 2 && src_path != e.path)
    e.src_path = src_path;

  if (!e.added() && mode_src != kNullMode)
    e.src = FileRef{src_path, mode_src, head[2]};
  if (!e.deleted() && mode_dst != kNullMode)
    e.dst = FileRef{e.path, mode_dst, head[3]};

  lookup_stats(e, stats);
  return e;
}

// Reads one `"..."` token starting at s[i]; i is left after the quote.
std::optional<std::string> read_quoted(const std::string &s, size_t &i) {
  if (i >= s.size() || s[i] != '"')
    return std::nullopt;
  size_t j = i + 1;
  while (j < s.size() && s[j] != '"') {
    if (s[j] == '\\')
      ++j;
    ++j;
  }
  if (j >= s.size())
    return std::nullopt;
  std::string tok = s.substr(i, j - i + 1);
  i = j + 1;
  return unquote_path(tok);
}

std::string strip_prefix(const std::string &p, const char *prefix) {
  return starts_with(p, prefix) ? p.substr(2) : p;
}

// "diff --git a/x b/y", either side possibly quoted
std::optional<std::pair<std::string, std::string>>
parse_diff_header(const std::string &line) {
  static const std::string kHeader = "diff --git ";
  std::string rest = line.substr(kHeader.size());
  std::string a, b;

  if (!rest.empty() && rest[0] == '"') {
    size_t i = 0;
    auto qa = read_quoted(rest, i);
    if (!qa || i >= rest.size() || rest[i] != ' ')
      return std::nullopt;
    ++i;
    if (i < rest.size() && rest[i] == '"') {
      auto qb = read_quoted(rest, i);
      if (!qb)
        return std::nullopt;
      b = *qb;
    } else {
      b = rest.substr(i);
    }
    a = *qa;
  } else if (rest.find(" \"b/") != std::string::npos) {
    size_t pos = rest.find(" \"b/");
    a = rest.substr(0, pos);
    size_t i = pos + 1;
    auto qb = read_quoted(rest, i);
    if (!qb)
      return std::nullopt;
    b = *qb;
  } else {
    // unquoted: "a/P b/P" splits in the middle when both names agree
    size_t n = rest.size();
    if (n >= 5 && (n - 5) % 2 == 0) {
      size_t plen = (n - 5) / 2;
      if (starts_with(rest, "a/") && rest[2 + plen] == ' ' &&
          rest.compare(3 + plen, 2, "b/") == 0 &&
          rest.compare(2, plen, rest, 5 + plen, plen) == 0) {
        a = rest.substr(0, 2 + plen);
        b = rest.substr(3 + plen);
      }
    }
    if (a.empty()) {
      size_t pos = rest.find(" b/");
      if (pos == std::string::npos)
        return std::nullopt;
      a = rest.substr(0, pos);
      b = rest.substr(pos + 1);
    }
  }
  if (!starts_with(a, "a/") || !starts_with(b, "b/"))
    return std::nullopt;
  return std::make_pair(strip_prefix(a, "a/"), strip_prefix(b, "b/"));
}

struct PatchFile {
  std::optional<std::string> src_path, dst_path;
  std::optional<std::string> src_mode, dst_mode;
  std::string src_sha, dst_sha;
  DiffStatus status = DiffStatus::Modified;
  std::optional<int> similarity;
  bool binary = false;
  bool in_hunks = false;
  std::string text;
};

std::string after(const std::string &line, size_t n) { return line.substr(n); }

void detect_type_change(PatchFile &f) {
  if (f.src_mode && f.dst_mode && f.src_mode->substr(0, 3) != f.dst_mode->substr(0, 3))
    f.status = DiffStatus::TypeChanged;
}

void parse_patch_metadata(PatchFile &f, const std::string &line, size_t index,
                          const std::string &output) {
  if (starts_with(line, "@@")) {
    f.in_hunks = true;
    return;
  }
  if (starts_with(line, "index ")) {
    auto fields = util::split_ws(after(line, 6));
    auto dots = fields.empty() ? std::string::npos : fields[0].find("..");
    if (dots == std::string::npos)
      fail("malformed index line", line, index, output);
    f.src_sha = fields[0].substr(0, dots);
    f.dst_sha = fields[0].substr(dots + 2);
    if (fields.size() > 1 && !f.src_mode && !f.dst_mode)
      f.src_mode = f.dst_mode = fields[1];
  } else if (starts_with(line, "new file mode ")) {
    f.status = DiffStatus::Added;
    f.dst_mode = after(line, 14);
    f.src_path.reset();
  } else if (starts_with(line, "deleted file mode ")) {
    f.status = DiffStatus::Deleted;
    f.src_mode = after(line, 18);
    f.dst_path.reset();
  } else if (starts_with(line, "old mode ")) {
    f.src_mode = after(line, 9);
    detect_type_change(f);
  } else if (starts_with(line, "new mode ")) {
    f.dst_mode = after(line, 9);
    detect_type_change(f);
  } else if (starts_with(line, "rename from ")) {
    f.src_path = unquote_path(after(line, 12));
    f.status = DiffStatus::Renamed;
  } else if (starts_with(line, "rename to ")) {
    f.dst_path = unquote_path(after(line, 10));
    f.status = DiffStatus::Renamed;
  } else if (starts_with(line, "copy from ")) {
    f.src_path = unquote_path(after(line, 10));
    f.status = DiffStatus::Copied;
  } else if (starts_with(line, "copy to ")) {
    f.dst_path = unquote_path(after(line, 8));
    f.status = DiffStatus::Copied;
  } else if (starts_with(line, "similarity index ")) {
    auto v = after(line, 17);
    if (!v.empty() && v.back() == '%')
      v.pop_back();
    if (!util::all_digits(v))
      fail("malformed similarity index", line, index, output);
    f.similarity = to_int(v);
  } else if (starts_with(line, "Binary files ") ||
             line == "GIT binary patch") {
    f.binary = true;
  }
}

DiffEntry finish_patch_file(const PatchFile &f, const NumstatMap &stats) {
  DiffEntry e;
  e.status = f.status;
  e.path = f.dst_path ? *f.dst_path : f.src_path.value_or("");
  if ((e.renamed() || e.copied()) && f.src_path && *f.src_path != e.path)
    e.src_path = f.src_path;
  if (e.renamed() || e.copied())
    e.similarity = f.similarity;
  if (f.src_path)
    e.src = FileRef{*f.src_path, f.src_mode.value_or(""), f.src_sha};
  if (f.dst_path)
    e.dst = FileRef{*f.dst_path, f.dst_mode.value_or(""), f.dst_sha};
  e.binary = f.binary;
  e.patch = f.text;
  lookup_stats(e, stats);
  return e;
}

} // namespace

std::optional<Shortstat> parse_shortstat(const std::string &line) {
  // " 3 files changed, 10 insertions(+), 2 deletions(-)"
  auto parts = util::split(line, ',');
  Shortstat s;
  bool saw_files = false;
  for (auto &raw : parts) {
    auto words = util::split_ws(raw);
    if (words.size() < 2 || !util::all_digits(words[0]))
      return std::nullopt;
    int n = to_int(words[0]);
    const auto &w = words[1];
    if ((w == "file" || w == "files") && words.size() == 3 && words[2] == "changed") {
      s.files_changed = n;
      saw_files = true;
    } else if (w == "insertion(+)" || w == "insertions(+)") {
      s.insertions = n;
    } else if (w == "deletion(-)" || w == "deletions(-)") {
      s.deletions = n;
    } else {
      return std::nullopt;
    }
  }
  if (!saw_files)
    return std::nullopt;
  return s;
}

DirstatInfo parse_dirstat(const std::vector<std::string> &lines,
                          const std::string &output) {
  std::vector<DirstatEntry> entries;
  for (size_t i = 0; i < lines.size(); ++i) {
    auto t = util::trim(lines[i]);
    auto pct = t.find('%');
    if (pct == std::string::npos || pct == 0)
      fail("malformed dirstat line", lines[i], i, output);
    char *end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + pct)
      fail("malformed dirstat percentage", lines[i], i, output);
    auto dir = util::trim(std::string_view(t).substr(pct + 1));
    dir = unquote_path(dir);
    if (dir.empty() || dir.back() != '/')
      fail("dirstat directory without trailing '/'", lines[i], i, output);
    entries.push_back(DirstatEntry{dir, v});
  }
  return DirstatInfo(std::move(entries));
}

std::pair<std::string, std::optional<std::string>>
parse_rename_path(const std::string &field) {
  static const std::string kArrow = " => ";
  auto arrow = field.find(kArrow);
  if (arrow == std::string::npos)
    return {unquote_path(field), std::nullopt};

  auto open = field.rfind('{', arrow);
  auto close = field.find('}', arrow);
  if (open != std::string::npos && close != std::string::npos) {
    std::string prefix = field.substr(0, open);
    std::string old_part = field.substr(open + 1, arrow - open - 1);
    std::string new_part = field.substr(arrow + kArrow.size(),
                                        close - arrow - kArrow.size());
    std::string suffix = field.substr(close + 1);
    auto join = [&](const std::string &mid) {
      // "a/{ => b}/c" leaves an empty side; collapse the doubled slash
      if (mid.empty() && util::ends_with(prefix, "/") && starts_with(suffix, "/"))
        return prefix + suffix.substr(1);
      return prefix + mid + suffix;
    };
    return {join(new_part), join(old_part)};
  }
  return {unquote_path(field.substr(arrow + kArrow.size())),
          unquote_path(field.substr(0, arrow))};
}

NumstatEntry parse_numstat_line(const std::string &line, size_t index,
                                const std::string &output) {
  auto parts = util::split(line, '\t', 3);
  if (parts.size() != 3 || !is_stat_count(parts[0]) || !is_stat_count(parts[1]))
    fail("malformed numstat line", line, index, output);

  NumstatEntry e;
  auto [path, src] = parse_rename_path(parts[2]);
  e.path = std::move(path);
  e.src_path = std::move(src);
  e.binary = parts[0] == "-" && parts[1] == "-";
  e.insertions = parts[0] == "-" ? 0 : to_int(parts[0]);
  e.deletions = parts[1] == "-" ? 0 : to_int(parts[1]);
  return e;
}

NumstatResult parse_numstat(const std::string &output, bool include_dirstat) {
  auto lines = util::split_lines(output);
  StatSections sections;
  for (size_t i = 0; i < lines.size(); ++i)
    classify_stat_line(sections, lines[i], i, output);

  std::vector<NumstatEntry> entries;
  entries.reserve(sections.numstat.size());
  for (auto &[idx, line] : sections.numstat)
    entries.push_back(parse_numstat_line(line, idx, output));

  std::optional<DirstatInfo> dirstat;
  if (include_dirstat)
    dirstat = parse_dirstat(sections.dirstat, output);
  return NumstatResult(std::move(entries), std::move(dirstat));
}

DiffResult parse_raw(const std::string &output, bool include_dirstat) {
  auto lines = util::split_lines(output);
  std::vector<std::pair<size_t, std::string>> raw;
  StatSections sections;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (starts_with(lines[i], ":"))
      raw.emplace_back(i, lines[i]);
    else
      classify_stat_line(sections, lines[i], i, output);
  }

  // numstat is correlated by path, so the two streams may come in any order
  const NumstatMap stats = build_numstat_map(sections, output);

  std::vector<DiffEntry> entries;
  entries.reserve(raw.size());
  for (auto &[idx, line] : raw)
    entries.push_back(parse_raw_line(line, idx, output, stats));

  std::optional<DirstatInfo> dirstat;
  if (include_dirstat)
    dirstat = parse_dirstat(sections.dirstat, output);
  return DiffResult(std::move(entries), std::move(dirstat));
}

DiffResult parse_patch(const std::string &output, bool include_dirstat) {
  if (output.empty())
    return include_dirstat ? DiffResult({}, DirstatInfo{}) : DiffResult{};

  // '\n' only: hunk lines of CRLF files keep their '\r'
  auto lines = util::split(output, '\n');
  if (lines.back().empty())
    lines.pop_back();
  size_t first_diff = lines.size();
  for (size_t i = 0; i < lines.size(); ++i) {
    if (starts_with(lines[i], "diff --git ")) {
      first_diff = i;
      break;
    }
  }

  StatSections sections;
  for (size_t i = 0; i < first_diff; ++i) {
    if (!lines[i].empty())
      classify_stat_line(sections, lines[i], i, output);
  }
  const NumstatMap stats = build_numstat_map(sections, output);

  std::vector<DiffEntry> entries;
  std::optional<PatchFile> cur;
  for (size_t i = first_diff; i < lines.size(); ++i) {
    const auto &line = lines[i];
    if (starts_with(line, "diff --git ")) {
      if (cur)
        entries.push_back(finish_patch_file(*cur, stats));
      auto paths = parse_diff_header(line);
      if (!paths)
        fail("malformed diff header", line, i, output);
      cur.emplace();
      cur->src_path = paths->first;
      cur->dst_path = paths->second;
      cur->text = line;
      continue;
    }
    cur->text += '\n';
    cur->text += line;
    if (!cur->in_hunks)
      parse_patch_metadata(*cur, line, i, output);
  }
  if (cur)
    entries.push_back(finish_patch_file(*cur, stats));

  spdlog::debug("[diff] parsed {} patch sections", entries.size());

  std::optional<DirstatInfo> dirstat;
  if (include_dirstat)
    dirstat = parse_dirstat(sections.dirstat, output);
  return DiffResult(std::move(entries), std::move(dirstat));
}

} // namespace diff_parser
} // namespace gitcli
