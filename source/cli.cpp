#include <gitcli/cli.hpp>

#include <string_view>

namespace gitcli {

static bool has_arg(size_t i, size_t n) { return i + 1 < n; }

static bool is_flag(std::string_view a) { return a.size() > 1 && a[0] == '-'; }

// Splits the operands after the subcommand at "--". `flag` consumes the
// recognized options and returns false for unknown ones.
template <typename F>
static bool parse_operands(const std::vector<std::string> &args, size_t i,
                           std::vector<std::string> &operands,
                           std::vector<std::string> &pathspecs,
                           std::string &error, F flag) {
  for (; i < args.size(); ++i) {
    const std::string &a = args[i];
    if (a == "--") {
      pathspecs.assign(args.begin() + static_cast<long>(i) + 1, args.end());
      return true;
    }
    if (is_flag(a)) {
      if (!flag(a)) {
        error = "unknown option '" + a + "'";
        return false;
      }
      continue;
    }
    operands.push_back(a);
  }
  return true;
}

ParseResult parse_cli(const std::vector<std::string> &args) {
  ParseResult r{};
  size_t i = 0;
  const size_t n = args.size();

  for (; i < n; ++i) {
    std::string_view a = args[i];
    if (a == "--git-dir" && has_arg(i, n)) {
      r.global.git_dir = args[++i];
    } else if (a == "--work-tree" && has_arg(i, n)) {
      r.global.work_tree = args[++i];
    } else if (a == "--timeout" && has_arg(i, n)) {
      r.global.timeout = args[++i];
    } else if (a == "--config" && has_arg(i, n)) {
      r.global.config = args[++i];
    } else if (a == "--verbose" || a == "-v") {
      r.global.verbose = true;
    } else if (a == "--help" || a == "-h") {
      r.cmd = CmdHelp{};
      return r;
    } else if (is_flag(a)) {
      r.error = "unknown option '" + std::string(a) + "' (or missing value)";
      return r;
    } else {
      break;
    }
  }

  if (i == n) {
    r.cmd = CmdHelp{};
    return r;
  }

  const std::string &cmd = args[i++];
  if (cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "version") {
    if (i != n) {
      r.error = "version: no arguments expected";
      return r;
    }
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "diff") {
    CmdDiff c{};
    bool ok = parse_operands(args, i, c.revisions, c.pathspecs, r.error,
                             [&](const std::string &a) {
                               if (a == "--patch" || a == "-p")
                                 c.patch = true;
                               else if (a == "--numstat")
                                 c.numstat = true;
                               else if (a == "--cached" || a == "--staged")
                                 c.cached = true;
                               else if (a == "-M" || a == "--find-renames")
                                 c.find_renames = true;
                               else if (a == "--dirstat")
                                 c.dirstat = "";
                               else if (a.rfind("--dirstat=", 0) == 0)
                                 c.dirstat = a.substr(10);
                               else
                                 return false;
                               return true;
                             });
    if (!ok)
      return r;
    if (c.patch && c.numstat) {
      r.error = "diff: --patch and --numstat are exclusive";
      return r;
    }
    if (c.revisions.size() > 2) {
      r.error = "diff: at most two revisions";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "status") {
    CmdStatus c{};
    std::vector<std::string> operands;
    bool ok = parse_operands(args, i, operands, c.pathspecs, r.error,
                             [&](const std::string &a) {
                               if (a != "--ignored")
                                 return false;
                               c.ignored = true;
                               return true;
                             });
    if (!ok)
      return r;
    // status has no revisions; bare operands are paths too
    c.pathspecs.insert(c.pathspecs.begin(), operands.begin(), operands.end());
    r.cmd = c;
    return r;
  }

  if (cmd == "fsck") {
    CmdFsck c{};
    std::vector<std::string> unused;
    bool ok = parse_operands(args, i, c.objects, unused, r.error,
                             [&](const std::string &a) {
                               if (a == "--unreachable")
                                 c.unreachable = true;
                               else if (a == "--name-objects")
                                 c.name_objects = true;
                               else if (a == "--root")
                                 c.root = true;
                               else if (a == "--tags")
                                 c.tags = true;
                               else if (a == "--strict")
                                 c.strict = true;
                               else
                                 return false;
                               return true;
                             });
    if (!ok)
      return r;
    if (!unused.empty()) {
      r.error = "fsck: pathspecs are not supported";
      return r;
    }
    r.cmd = c;
    return r;
  }

  r.error = "unknown command '" + cmd + "'";
  return r;
}

ParseResult parse_cli(int argc, char **argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i)
    args.emplace_back(argv[i]);
  return parse_cli(args);
}

} // namespace gitcli
