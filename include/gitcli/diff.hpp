#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gitcli {

enum class DiffStatus {
  Modified,
  Added,
  Deleted,
  Renamed,
  Copied,
  TypeChanged,
  Unmerged
};

const char *to_string(DiffStatus s);

struct FileRef {
  std::string path;
  std::string mode; // "100644", may be empty when the format omits it
  std::string blob_id;

  bool regular_file() const { return mode == "100644"; }
  bool executable() const { return mode == "100755"; }
  bool symlink() const { return mode == "120000"; }
  bool submodule() const { return mode == "160000"; }

  bool operator==(const FileRef &o) const {
    return path == o.path && mode == o.mode && blob_id == o.blob_id;
  }
  bool operator!=(const FileRef &o) const { return !(*this == o); }
};

struct DiffEntry {
  DiffStatus status = DiffStatus::Modified;
  std::string path;
  // only for renamed/copied entries whose source differs from `path`
  std::optional<std::string> src_path;
  std::optional<FileRef> src; // absent for added
  std::optional<FileRef> dst; // absent for deleted
  std::optional<int> similarity;
  int insertions = 0;
  int deletions = 0;
  bool binary = false;
  // full text of this file's section, patch format only
  std::string patch;

  bool added() const { return status == DiffStatus::Added; }
  bool deleted() const { return status == DiffStatus::Deleted; }
  bool renamed() const { return status == DiffStatus::Renamed; }
  bool copied() const { return status == DiffStatus::Copied; }
  bool type_changed() const { return status == DiffStatus::TypeChanged; }
  bool unmerged() const { return status == DiffStatus::Unmerged; }
  bool submodule() const {
    return (src && src->submodule()) || (dst && dst->submodule());
  }

  bool operator==(const DiffEntry &o) const;
  bool operator!=(const DiffEntry &o) const { return !(*this == o); }
};

struct DirstatEntry {
  std::string directory; // always ends with '/'
  double percent = 0;

  bool operator==(const DirstatEntry &o) const {
    return directory == o.directory && percent == o.percent;
  }
};

class DirstatInfo {
public:
  DirstatInfo() = default;
  explicit DirstatInfo(std::vector<DirstatEntry> entries)
      : entries_(std::move(entries)) {}

  const std::vector<DirstatEntry> &entries() const { return entries_; }
  std::optional<double> find(const std::string &directory) const;
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  bool operator==(const DirstatInfo &o) const { return entries_ == o.entries_; }

private:
  std::vector<DirstatEntry> entries_;
};

// Totals are derived from the entries, never read back from the tool.
class DiffResult {
public:
  DiffResult() = default;
  explicit DiffResult(std::vector<DiffEntry> entries,
                      std::optional<DirstatInfo> dirstat = std::nullopt);

  const std::vector<DiffEntry> &entries() const { return entries_; }
  std::size_t files_changed() const { return entries_.size(); }
  long total_insertions() const { return total_insertions_; }
  long total_deletions() const { return total_deletions_; }
  const std::optional<DirstatInfo> &dirstat() const { return dirstat_; }

  // first entry for path (destination path for renames)
  const DiffEntry *find(const std::string &path) const;

  bool operator==(const DiffResult &o) const {
    return entries_ == o.entries_ && dirstat_ == o.dirstat_;
  }

private:
  std::vector<DiffEntry> entries_;
  long total_insertions_ = 0;
  long total_deletions_ = 0;
  std::optional<DirstatInfo> dirstat_;
};

struct NumstatEntry {
  std::string path;
  std::optional<std::string> src_path;
  int insertions = 0;
  int deletions = 0;
  bool binary = false;

  bool operator==(const NumstatEntry &o) const {
    return path == o.path && src_path == o.src_path &&
           insertions == o.insertions && deletions == o.deletions &&
           binary == o.binary;
  }
};

class NumstatResult {
public:
  NumstatResult() = default;
  explicit NumstatResult(std::vector<NumstatEntry> entries,
                         std::optional<DirstatInfo> dirstat = std::nullopt);

  const std::vector<NumstatEntry> &entries() const { return entries_; }
  std::size_t files_changed() const { return entries_.size(); }
  long total_insertions() const { return total_insertions_; }
  long total_deletions() const { return total_deletions_; }
  const std::optional<DirstatInfo> &dirstat() const { return dirstat_; }

  bool operator==(const NumstatResult &o) const {
    return entries_ == o.entries_ && dirstat_ == o.dirstat_;
  }

private:
  std::vector<NumstatEntry> entries_;
  long total_insertions_ = 0;
  long total_deletions_ = 0;
  std::optional<DirstatInfo> dirstat_;
};

} // namespace gitcli
