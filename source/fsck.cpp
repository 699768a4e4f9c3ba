#include <gitcli/errors.hpp>
#include <gitcli/fsck.hpp>
#include <gitcli/util.hpp>

#include <spdlog/spdlog.h>

namespace gitcli {

using util::starts_with;

const char *to_string(ObjectType t) {
  switch (t) {
  case ObjectType::Commit: return "commit";
  case ObjectType::Tree: return "tree";
  case ObjectType::Blob: return "blob";
  case ObjectType::Tag: return "tag";
  case ObjectType::Unknown: return "unknown";
  }
  return "unknown";
}

std::optional<ObjectType> parse_object_type(const std::string &s) {
  if (s == "commit") return ObjectType::Commit;
  if (s == "tree") return ObjectType::Tree;
  if (s == "blob") return ObjectType::Blob;
  if (s == "tag") return ObjectType::Tag;
  return std::nullopt;
}

std::vector<FsckObject> FsckResult::all_objects() const {
  std::vector<FsckObject> out;
  out.reserve(count());
  out.insert(out.end(), dangling.begin(), dangling.end());
  out.insert(out.end(), missing.begin(), missing.end());
  out.insert(out.end(), unreachable.begin(), unreachable.end());
  out.insert(out.end(), warnings.begin(), warnings.end());
  return out;
}

namespace fsck_parser {

namespace {

struct LineParser {
  const std::string &line;
  size_t index;
  const std::string &output;

  [[noreturn]] void fail(const std::string &why) const {
    throw UnexpectedResultError(why, line, index, output);
  }

  ObjectType type(const std::string &s) const {
    auto t = parse_object_type(s);
    if (!t)
      fail("unknown object type '" + s + "'");
    return *t;
  }

  std::string sha(const std::string &s) const {
    if (s.size() != 40 || !util::is_hex(s))
      fail("malformed object id '" + s + "'");
    return s;
  }
};

bool is_sha(const std::string &s) { return s.size() == 40 && util::is_hex(s); }

// "<type> <sha>[ (<name>)]"
FsckObject parse_object(const LineParser &p, const std::string &rest) {
  auto sp1 = rest.find(' ');
  if (sp1 == std::string::npos)
    p.fail("missing object id");
  FsckObject o;
  o.type = p.type(rest.substr(0, sp1));
  auto sp2 = rest.find(' ', sp1 + 1);
  o.sha = p.sha(rest.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos
                                                              : sp2 - sp1 - 1));
  if (sp2 != std::string::npos) {
    auto tail = rest.substr(sp2 + 1);
    if (tail.size() < 2 || tail.front() != '(' || tail.back() != ')')
      p.fail("malformed object name");
    o.name = tail.substr(1, tail.size() - 2);
  }
  return o;
}

// "<type> <sha> (<name>) in <tag-sha>"
FsckObject parse_tagged(const LineParser &p, const std::string &rest) {
  static const std::string kIn = ") in ";
  auto in = rest.rfind(kIn);
  if (in == std::string::npos)
    p.fail("tagged line without 'in <sha>'");
  FsckObject o = parse_object(p, rest.substr(0, in + 1));
  if (!o.name)
    p.fail("tagged line without tag name");
  o.tag_sha = p.sha(rest.substr(in + kIn.size()));
  return o;
}

// "root <sha>" (older) or "root <type> <sha>"
FsckObject parse_root(const LineParser &p, const std::string &rest) {
  auto words = util::split_ws(rest);
  if (words.size() == 1 && is_sha(words[0]))
    return FsckObject{ObjectType::Commit, words[0], std::nullopt, std::nullopt,
                      std::nullopt};
  return parse_object(p, rest);
}

// "warning in <type> <sha>: <message>"
FsckObject parse_warning_in(const LineParser &p, const std::string &rest) {
  auto colon = rest.find(": ");
  if (colon == std::string::npos)
    p.fail("warning without message");
  FsckObject o = parse_object(p, rest.substr(0, colon));
  o.message = rest.substr(colon + 2);
  return o;
}

} // namespace

FsckResult parse(const std::string &output) {
  FsckResult r;
  auto lines = util::split_lines(output);
  for (size_t i = 0; i < lines.size(); ++i) {
    auto line = util::trim(lines[i]);
    LineParser p{line, i, output};

    if (starts_with(line, "dangling ")) {
      r.dangling.push_back(parse_object(p, line.substr(9)));
    } else if (starts_with(line, "missing ")) {
      r.missing.push_back(parse_object(p, line.substr(8)));
    } else if (starts_with(line, "unreachable ")) {
      r.unreachable.push_back(parse_object(p, line.substr(12)));
    } else if (starts_with(line, "root ")) {
      r.root.push_back(parse_root(p, line.substr(5)));
    } else if (starts_with(line, "tagged ")) {
      r.tagged.push_back(parse_tagged(p, line.substr(7)));
    } else if (starts_with(line, "warning in ")) {
      r.warnings.push_back(parse_warning_in(p, line.substr(11)));
    } else if (starts_with(line, "warning: ")) {
      FsckObject o;
      o.message = line.substr(9);
      r.warnings.push_back(std::move(o));
    } else {
      spdlog::debug("[fsck] ignoring line {}: {}", i, line);
    }
  }
  return r;
}

} // namespace fsck_parser
} // namespace gitcli
