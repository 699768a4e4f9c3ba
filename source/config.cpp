#include <gitcli/config.hpp>
#include <gitcli/errors.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

namespace gitcli {

static std::string trim(std::string s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                        s.back() == '\r' || s.back() == '\n'))
    s.pop_back();
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t'))
    ++i;
  return s.substr(i);
}

static std::string lower(std::string s) {
  for (auto &ch : s)
    ch = (char)std::tolower((unsigned char)ch);
  return s;
}

std::chrono::duration<double> parse_seconds(const std::string &s) {
  auto t = trim(s);
  if (t.empty())
    throw ArgumentError("timeout: empty value");
  char *end = nullptr;
  double v = std::strtod(t.c_str(), &end);
  if (end == t.c_str() || *end != '\0' || !std::isfinite(v))
    throw ArgumentError("timeout: not a number: '" + t + "'");
  if (v < 0)
    throw ArgumentError("timeout: must not be negative: '" + t + "'");
  return std::chrono::duration<double>(v);
}

static void apply_key(Config &c, const std::string &key, const std::string &val) {
  if (key == "binary") {
    if (val.empty())
      throw ConfigError("binary: empty value");
    c.binary_path = val;
  } else if (key == "timeout") {
    c.timeout = parse_seconds(val);
  } else if (key == "ssh") {
    if (val.empty())
      c.git_ssh.reset();
    else
      c.git_ssh = val;
  } else if (key == "kill_grace") {
    c.kill_grace = parse_seconds(val);
  } else {
    spdlog::warn("[config] unknown key '{}'", key);
  }
}

Config Config::load(const fs::path &p) { return load(p, Config{}); }

Config Config::load(const fs::path &p, Config c) {
  std::ifstream in(p);
  if (!in)
    throw ConfigError("cannot open config: " + p.string());

  std::string line, section;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    auto s = trim(line);
    if (s.empty() || s[0] == '#' || s[0] == ';')
      continue;
    if (s.front() == '[') {
      if (s.back() != ']')
        throw ConfigError(fmt::format("{}:{}: bad section header", p.string(), lineno));
      section = lower(trim(s.substr(1, s.size() - 2)));
      continue;
    }
    auto pos = s.find('=');
    if (pos == std::string::npos)
      throw ConfigError(fmt::format("{}:{}: expected key = value", p.string(), lineno));
    auto k = lower(trim(s.substr(0, pos)));
    auto v = trim(s.substr(pos + 1));
    if (section != "core") {
      spdlog::debug("[config] skipping [{}] {}", section, k);
      continue;
    }
    try {
      apply_key(c, k, v);
    } catch (const ArgumentError &e) {
      throw ConfigError(fmt::format("{}:{}: {}", p.string(), lineno, e.what()));
    }
  }
  return c;
}

Config Config::from_env() { return from_env(Config{}); }

Config Config::from_env(Config c) {
  if (const char *v = ::getenv("GITCLI_BINARY"); v && *v)
    c.binary_path = v;
  if (const char *v = ::getenv("GITCLI_TIMEOUT"); v && *v) {
    try {
      c.timeout = parse_seconds(v);
    } catch (const ArgumentError &e) {
      spdlog::warn("[config] ignoring GITCLI_TIMEOUT: {}", e.what());
    }
  }
  if (const char *v = ::getenv("GITCLI_SSH"); v && *v)
    c.git_ssh = std::string(v);
  if (const char *v = ::getenv("GITCLI_KILL_GRACE"); v && *v) {
    try {
      c.kill_grace = parse_seconds(v);
    } catch (const ArgumentError &e) {
      spdlog::warn("[config] ignoring GITCLI_KILL_GRACE: {}", e.what());
    }
  }
  return c;
}

static std::mutex g_mu;
static Config g_config;

Config Config::global() {
  std::lock_guard<std::mutex> lk(g_mu);
  return g_config;
}

void Config::set_global(Config c) {
  std::lock_guard<std::mutex> lk(g_mu);
  g_config = std::move(c);
}

} // namespace gitcli
