#include <gitcli/diff.hpp>

namespace gitcli {

const char *to_string(DiffStatus s) {
  switch (s) {
  case DiffStatus::Modified: return "modified";
  case DiffStatus::Added: return "added";
  case DiffStatus::Deleted: return "deleted";
  case DiffStatus::Renamed: return "renamed";
  case DiffStatus::Copied: return "copied";
  case DiffStatus::TypeChanged: return "type_changed";
  case DiffStatus::Unmerged: return "unmerged";
  }
  return "unknown";
}

bool DiffEntry::operator==(const DiffEntry &o) const {
  return status == o.status && path == o.path && src_path == o.src_path &&
         src == o.src && dst == o.dst && similarity == o.similarity &&
         insertions == o.insertions && deletions == o.deletions &&
         binary == o.binary && patch == o.patch;
}

std::optional<double> DirstatInfo::find(const std::string &directory) const {
  for (auto &e : entries_)
    if (e.directory == directory)
      return e.percent;
  return std::nullopt;
}

DiffResult::DiffResult(std::vector<DiffEntry> entries,
                       std::optional<DirstatInfo> dirstat)
    : entries_(std::move(entries)), dirstat_(std::move(dirstat)) {
  for (auto &e : entries_) {
    total_insertions_ += e.insertions;
    total_deletions_ += e.deletions;
  }
}

const DiffEntry *DiffResult::find(const std::string &path) const {
  for (auto &e : entries_)
    if (e.path == path)
      return &e;
  return nullptr;
}

NumstatResult::NumstatResult(std::vector<NumstatEntry> entries,
                             std::optional<DirstatInfo> dirstat)
    : entries_(std::move(entries)), dirstat_(std::move(dirstat)) {
  for (auto &e : entries_) {
    total_insertions_ += e.insertions;
    total_deletions_ += e.deletions;
  }
}

} // namespace gitcli
