#pragma once
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gitcli {

// One path from `git status --porcelain=v2`. Index/repo fields are exactly
// what the report carries: an all-zero mode or id is kept as-is, and absent
// fields stay nullopt.
struct StatusEntry {
  std::string path;
  std::optional<std::string> type; // "M", "A", "D", "R", "C", "T", "U"
  std::optional<std::string> stage;
  bool untracked = false;
  bool ignored = false;

  std::optional<std::string> mode_index;
  std::optional<std::string> sha_index;
  std::optional<std::string> mode_repo; // HEAD side
  std::optional<std::string> sha_repo;
  std::optional<std::string> mode_worktree;

  char index_status = '.';    // X
  char worktree_status = '.'; // Y
  std::string submodule;      // "N..." or "S<c><m><u>"

  // rename/copy entries
  std::optional<std::string> orig_path;
  std::optional<int> score;

  // unmerged entries: stages 1 (base), 2 (ours), 3 (theirs)
  std::optional<std::array<std::string, 3>> stage_modes;
  std::optional<std::array<std::string, 3>> stage_shas;

  bool operator==(const StatusEntry &o) const;
};

struct BranchInfo {
  std::optional<std::string> oid;      // nullopt for "(initial)"
  std::optional<std::string> head;     // nullopt for "(detached)"
  std::optional<std::string> upstream;
  std::optional<int> ahead;
  std::optional<int> behind;

  bool operator==(const BranchInfo &o) const {
    return oid == o.oid && head == o.head && upstream == o.upstream &&
           ahead == o.ahead && behind == o.behind;
  }
};

class StatusReport {
public:
  using Map = std::map<std::string, StatusEntry>;

  StatusReport() = default;
  StatusReport(Map entries, std::optional<BranchInfo> branch)
      : entries_(std::move(entries)), branch_(std::move(branch)) {}

  const Map &entries() const { return entries_; }
  const std::optional<BranchInfo> &branch() const { return branch_; }
  const StatusEntry *find(const std::string &path) const;
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  std::vector<const StatusEntry *> changed() const;
  std::vector<const StatusEntry *> added() const;
  std::vector<const StatusEntry *> deleted() const;
  std::vector<const StatusEntry *> untracked() const;

  bool operator==(const StatusReport &o) const {
    return entries_ == o.entries_ && branch_ == o.branch_;
  }

private:
  std::vector<const StatusEntry *> with_type(const char *t) const;

  Map entries_;
  std::optional<BranchInfo> branch_;
};

namespace status_parser {

StatusReport parse(const std::string &output);

} // namespace status_parser
} // namespace gitcli
