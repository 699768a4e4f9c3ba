#pragma once
#include <optional>
#include <string>
#include <vector>

namespace gitcli {

enum class ObjectType { Commit, Tree, Blob, Tag, Unknown };

const char *to_string(ObjectType t);
std::optional<ObjectType> parse_object_type(const std::string &s);

struct FsckObject {
  ObjectType type = ObjectType::Unknown;
  std::string sha; // 40 hex; empty for free-text warnings
  std::optional<std::string> name;
  std::optional<std::string> message;
  // "tagged ... in <sha>": the tag object that names this one
  std::optional<std::string> tag_sha;

  bool operator==(const FsckObject &o) const {
    return type == o.type && sha == o.sha && name == o.name &&
           message == o.message && tag_sha == o.tag_sha;
  }
};

struct FsckResult {
  std::vector<FsckObject> dangling;
  std::vector<FsckObject> missing;
  std::vector<FsckObject> unreachable;
  std::vector<FsckObject> warnings;
  std::vector<FsckObject> root;
  std::vector<FsckObject> tagged;

  // root and tagged are informational and do not count
  bool any_issues() const {
    return !dangling.empty() || !missing.empty() || !unreachable.empty() ||
           !warnings.empty();
  }
  bool empty() const { return !any_issues(); }
  std::vector<FsckObject> all_objects() const;
  std::size_t count() const {
    return dangling.size() + missing.size() + unreachable.size() +
           warnings.size();
  }

  bool operator==(const FsckResult &o) const {
    return dangling == o.dangling && missing == o.missing &&
           unreachable == o.unreachable && warnings == o.warnings &&
           root == o.root && tagged == o.tagged;
  }
};

namespace fsck_parser {

FsckResult parse(const std::string &output);

} // namespace fsck_parser
} // namespace gitcli
