#pragma once
#include "diff.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gitcli {

struct Shortstat {
  int files_changed = 0;
  int insertions = 0;
  int deletions = 0;
};

struct FileStats {
  int insertions = 0;
  int deletions = 0;
  bool binary = false;
};

// Per-file counts from a numstat stream, keyed by destination path and, for
// renames/copies, by the (source, destination) pair.
class NumstatMap {
public:
  void add(const NumstatEntry &e);
  std::optional<FileStats> lookup(const std::string &path) const;
  std::optional<FileStats> lookup(const std::string &src_path,
                                  const std::string &path) const;
  bool empty() const { return by_path_.empty(); }

private:
  std::map<std::string, FileStats> by_path_;
  std::map<std::pair<std::string, std::string>, FileStats> by_pair_;
};

namespace diff_parser {

// `diff --raw [--numstat] [--shortstat] [--dirstat]` output
DiffResult parse_raw(const std::string &output, bool include_dirstat = false);

// `diff --patch [--numstat] [--shortstat] [--dirstat]` output
DiffResult parse_patch(const std::string &output, bool include_dirstat = false);

// `diff --numstat [--shortstat] [--dirstat]` output
NumstatResult parse_numstat(const std::string &output,
                            bool include_dirstat = false);

// "<ins>\t<del>\t<path>"; `-` counts mark a binary file
NumstatEntry parse_numstat_line(const std::string &line, size_t index,
                                const std::string &output);

// "  42.0% dir/" lines, in emission order
DirstatInfo parse_dirstat(const std::vector<std::string> &lines,
                          const std::string &output = {});

std::optional<Shortstat> parse_shortstat(const std::string &line);

// "a => b" and "dir/{a => b}/f" numstat rename notation.
// Returns (path, src_path).
std::pair<std::string, std::optional<std::string>>
parse_rename_path(const std::string &field);

} // namespace diff_parser
} // namespace gitcli
