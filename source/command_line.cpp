#include <gitcli/command_line.hpp>
#include <gitcli/encoding.hpp>
#include <gitcli/errors.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <exception>
#include <map>
#include <system_error>
#include <thread>

extern char **environ;

namespace gitcli {

namespace {

struct Fd {
  int fd = -1;
  Fd() = default;
  Fd(const Fd &) = delete;
  Fd &operator=(const Fd &) = delete;
  ~Fd() { reset(); }
  void reset() {
    if (fd >= 0)
      ::close(fd);
    fd = -1;
  }
};

struct Pipe {
  Fd r, w;
};

void make_cloexec_pipe(Pipe &p) {
  int pfd[2];
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) != 0)
    throw std::system_error(errno, std::generic_category(), "pipe2");
#else
  if (::pipe(pfd) != 0)
    throw std::system_error(errno, std::generic_category(), "pipe");
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
#endif
  p.r.fd = pfd[0];
  p.w.fd = pfd[1];
}

// Reads one stream until EOF or `stop`, mirroring into the sink. A sink
// failure stops the pump and raises `abort`. `done` is set on exit.
struct Pump {
  std::string captured;
  std::exception_ptr error;
  std::atomic_bool done{false};

  void run(int fd, Sink *sink, std::atomic_bool &abort,
           const std::atomic_bool &stop) {
    read_loop(fd, sink, abort, stop);
    done = true;
  }

private:
  void read_loop(int fd, Sink *sink, std::atomic_bool &abort,
                 const std::atomic_bool &stop) {
    std::array<char, 4096> buf{};
    while (!stop) {
      pollfd pfd{fd, POLLIN, 0};
      int pr = ::poll(&pfd, 1, 50);
      if (pr < 0 && errno == EINTR)
        continue;
      if (pr < 0)
        break;
      if (pr == 0)
        continue;
      ssize_t n = ::read(fd, buf.data(), buf.size());
      if (n < 0 && errno == EINTR)
        continue;
      if (n <= 0)
        break;
      captured.append(buf.data(), static_cast<size_t>(n));
      if (!sink)
        continue;
      try {
        sink->write(buf.data(), static_cast<size_t>(n));
      } catch (...) {
        error = std::current_exception();
        abort = true;
        break;
      }
    }
  }
};

void write_stdin(int fd, const std::string &data) {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGPIPE);
  pthread_sigmask(SIG_BLOCK, &set, nullptr);

  const char *p = data.data();
  size_t left = data.size();
  while (left > 0) {
    ssize_t w = ::write(fd, p, left);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      if (errno == EPIPE) {
        // child closed stdin early; drop the pending SIGPIPE
        timespec zero{0, 0};
        ::sigtimedwait(&set, nullptr, &zero);
      }
      break;
    }
    p += w;
    left -= static_cast<size_t>(w);
  }
}

ExitStatus decode_wait_status(int st) {
  if (WIFSIGNALED(st))
    return Signaled{WTERMSIG(st)};
  return Exited{WIFEXITED(st) ? WEXITSTATUS(st) : -1};
}

std::string chomp(std::string s) {
  if (!s.empty() && s.back() == '\n') {
    s.pop_back();
    if (!s.empty() && s.back() == '\r')
      s.pop_back();
  } else if (!s.empty() && s.back() == '\r') {
    s.pop_back();
  }
  return s;
}

} // namespace

std::string post_process(std::string raw, const RunOptions &opts) {
  if (opts.normalize)
    raw = normalize_encoding(raw, opts.encoding);
  if (opts.chomp)
    raw = chomp(std::move(raw));
  return raw;
}

CommandLine::CommandLine(EnvOverrides env, std::string binary_path,
                         std::vector<std::string> global_opts,
                         std::shared_ptr<spdlog::logger> logger)
    : env_(std::move(env)), binary_path_(std::move(binary_path)),
      global_opts_(std::move(global_opts)), logger_(std::move(logger)) {}

std::vector<std::string>
CommandLine::build_command(const std::vector<std::string> &args) const {
  std::vector<std::string> cmd;
  cmd.reserve(1 + global_opts_.size() + args.size());
  cmd.push_back(binary_path_);
  cmd.insert(cmd.end(), global_opts_.begin(), global_opts_.end());
  cmd.insert(cmd.end(), args.begin(), args.end());
  return cmd;
}

std::vector<std::string>
CommandLine::merged_environment(const EnvOverrides &env) {
  std::map<std::string, std::string> vars;
  for (char **e = environ; e && *e; ++e) {
    const char *eq = std::strchr(*e, '=');
    if (!eq)
      continue;
    vars[std::string(*e, static_cast<size_t>(eq - *e))] = std::string(eq + 1);
  }
  for (auto &[k, v] : env) {
    if (v)
      vars[k] = *v;
    else
      vars.erase(k);
  }
  std::vector<std::string> out;
  out.reserve(vars.size());
  for (auto &[k, v] : vars)
    out.push_back(k + "=" + v);
  return out;
}

InvocationResult CommandLine::run(const std::vector<std::string> &args,
                                  const RunOptions &opts) const {
  using clock = std::chrono::steady_clock;

  if (binary_path_.empty())
    throw ArgumentError("binary path is empty");
  if (opts.timeout && opts.timeout->count() < 0)
    throw ArgumentError(
        fmt::format("timeout must not be negative: {}", opts.timeout->count()));
  if (opts.normalize)
    check_encoding(opts.encoding);

  auto *log = logger_ ? logger_.get() : spdlog::default_logger_raw();
  const auto cmd = build_command(args);
  const std::string cmd_str = fmt::format("{}", fmt::join(cmd, " "));

  std::vector<char *> argv;
  argv.reserve(cmd.size() + 1);
  for (auto &s : cmd)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);

  const auto env_strings = merged_environment(env_);
  std::vector<char *> envp;
  envp.reserve(env_strings.size() + 1);
  for (auto &s : env_strings)
    envp.push_back(const_cast<char *>(s.c_str()));
  envp.push_back(nullptr);

  Pipe out_p, err_p, in_p, exec_p;
  try {
    make_cloexec_pipe(out_p);
    if (!opts.merge)
      make_cloexec_pipe(err_p);
    if (opts.input)
      make_cloexec_pipe(in_p);
    make_cloexec_pipe(exec_p);
  } catch (const std::system_error &) {
    throw ProcessIOError("cannot create pipes for " + cmd_str,
                         std::current_exception());
  }

  const char *cwd = opts.chdir.empty() ? nullptr : opts.chdir.c_str();

  pid_t pid = ::fork();
  if (pid < 0) {
    throw ProcessIOError(
        "fork failed for " + cmd_str,
        std::make_exception_ptr(
            std::system_error(errno, std::generic_category(), "fork")));
  }

  if (pid == 0) {
    ::setpgid(0, 0);

    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGPIPE, SIG_DFL);

    int err = 0;
    if (cwd && ::chdir(cwd) != 0)
      err = errno;

    if (!err) {
      if (opts.input) {
        ::dup2(in_p.r.fd, STDIN_FILENO);
      } else {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
          ::dup2(devnull, STDIN_FILENO);
          ::close(devnull);
        }
      }
      ::dup2(out_p.w.fd, STDOUT_FILENO);
      ::dup2(opts.merge ? out_p.w.fd : err_p.w.fd, STDERR_FILENO);

      environ = envp.data();
      ::execvp(argv[0], argv.data());
      err = errno;
    }
    (void)!::write(exec_p.w.fd, &err, sizeof(err));
    _exit(127);
  }

  // both sides call setpgid so the group exists before any kill(-pid)
  ::setpgid(pid, pid);
  const auto started = clock::now();

  out_p.w.reset();
  err_p.w.reset();
  in_p.r.reset();
  exec_p.w.reset();

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_p.r.fd, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  exec_p.r.reset();

  if (n > 0) {
    int st = 0;
    ::waitpid(pid, &st, 0);
    log->error("{} could not be started: {}", cmd_str, std::strerror(child_errno));
    throw ProcessIOError(
        fmt::format("failed to spawn {}", cmd_str),
        std::make_exception_ptr(std::system_error(
            child_errno, std::generic_category(), binary_path_)));
  }

  std::atomic_bool abort{false};
  std::atomic_bool stop{false};
  Pump out_pump, err_pump;
  std::thread out_thread(
      [&] { out_pump.run(out_p.r.fd, opts.out, abort, stop); });
  std::thread err_thread;
  if (opts.merge)
    err_pump.done = true;
  else
    err_thread = std::thread(
        [&] { err_pump.run(err_p.r.fd, opts.err, abort, stop); });
  std::thread in_thread;
  if (opts.input) {
    in_thread = std::thread([&] {
      write_stdin(in_p.w.fd, *opts.input);
      in_p.w.reset();
    });
  }

  const bool has_deadline = opts.timeout && opts.timeout->count() > 0;
  const auto deadline =
      has_deadline
          ? started + std::chrono::duration_cast<clock::duration>(*opts.timeout)
          : clock::time_point::max();
  clock::time_point kill_at = clock::time_point::max();
  // after SIGKILL, how long to wait for the pipes before dropping them
  clock::time_point give_up = clock::time_point::max();
  bool timed_out = false;
  bool aborted = false;
  bool reaped = false;
  int signal_used = 0;
  int status = 0;
  int wait_errno = 0;
  const auto grace = std::chrono::duration_cast<clock::duration>(opts.kill_grace);

  // The deadline covers the whole group: a descendant that outlives the
  // child and keeps a pipe open is still subject to it.
  for (;;) {
    if (!reaped) {
      pid_t r = ::waitpid(pid, &status, WNOHANG);
      if (r == pid) {
        reaped = true;
      } else if (r < 0 && errno != EINTR) {
        wait_errno = errno;
        reaped = true;
        ::kill(-pid, SIGKILL);
        give_up = clock::now() + grace;
      }
    }
    if (reaped && out_pump.done && err_pump.done)
      break;

    auto now = clock::now();
    if (abort && !aborted) {
      aborted = true;
      ::kill(-pid, SIGKILL);
      give_up = now + grace;
    } else if (!timed_out && now >= deadline) {
      timed_out = true;
      signal_used = SIGTERM;
      log->warn("{} timed out after {}s, sending SIGTERM", cmd_str,
                opts.timeout->count());
      ::kill(-pid, SIGTERM);
      kill_at = now + grace;
    } else if (timed_out && signal_used != SIGKILL && now >= kill_at) {
      signal_used = SIGKILL;
      log->warn("{} still alive after {}s grace, sending SIGKILL", cmd_str,
                opts.kill_grace.count());
      ::kill(-pid, SIGKILL);
      give_up = now + grace;
    } else if (now >= give_up) {
      // pipes held by a process outside the group
      log->warn("{} output still open after SIGKILL, closing", cmd_str);
      stop = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  if (!reaped) {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
  }

  out_thread.join();
  if (err_thread.joinable())
    err_thread.join();
  if (in_thread.joinable())
    in_thread.join();

  if (out_pump.error || err_pump.error) {
    const char *which = out_pump.error ? "stdout" : "stderr";
    auto cause = out_pump.error ? out_pump.error : err_pump.error;
    log->error("{}: {} sink failed, invocation aborted", cmd_str, which);
    throw ProcessIOError(fmt::format("Pipe Exception for {}: {}", cmd_str, which),
                         cause);
  }

  if (wait_errno) {
    throw ProcessIOError(
        fmt::format("waitpid failed for {}", cmd_str),
        std::make_exception_ptr(
            std::system_error(wait_errno, std::generic_category(), "waitpid")));
  }

  ExitStatus exit_status = decode_wait_status(status);
  if (timed_out)
    exit_status = TimedOut{*opts.timeout, signal_used};

  InvocationResult result(cmd, exit_status,
                          post_process(std::move(out_pump.captured), opts),
                          post_process(std::move(err_pump.captured), opts));

  log->info("{} exited with status {}", cmd_str, to_string(exit_status));
  log->debug("stdout:\n{}\nstderr:\n{}", quote(result.std_out()),
             quote(result.std_err()));

  if (result.timed_out())
    throw TimeoutError(result, *opts.timeout);
  if (result.signaled())
    throw SignaledError(result);
  return result;
}

} // namespace gitcli
