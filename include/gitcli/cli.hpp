#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gitcli {

struct GlobalOptions {
  std::optional<std::string> git_dir;
  std::optional<std::string> work_tree;
  std::optional<std::string> config;
  std::optional<std::string> timeout;
  bool verbose = false;
};

struct CmdDiff {
  std::vector<std::string> revisions;
  std::vector<std::string> pathspecs;
  bool patch = false;
  bool numstat = false;
  bool cached = false;
  bool find_renames = false;
  std::optional<std::string> dirstat;
};

struct CmdStatus {
  std::vector<std::string> pathspecs;
  bool ignored = false;
};

struct CmdFsck {
  std::vector<std::string> objects;
  bool unreachable = false;
  bool name_objects = false;
  bool root = false;
  bool tags = false;
  bool strict = false;
};

struct CmdVersion {};
struct CmdHelp {};

using Command = std::variant<CmdDiff, CmdStatus, CmdFsck, CmdVersion, CmdHelp>;

struct ParseResult {
  GlobalOptions global;
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(const std::vector<std::string> &args);
ParseResult parse_cli(int argc, char **argv);

} // namespace gitcli
