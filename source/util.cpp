#include <gitcli/util.hpp>

namespace gitcli {
namespace util {

std::vector<std::string> split_lines(std::string_view text, bool skip_empty) {
  std::vector<std::string> out;
  if (text.empty())
    return out;
  size_t start = 0;
  while (start <= text.size()) {
    size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos)
      nl = text.size();
    std::string_view line = text.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);
    if (!(skip_empty && line.empty()))
      out.emplace_back(line);
    if (nl == text.size())
      break;
    start = nl + 1;
  }
  if (!skip_empty && !out.empty() && out.back().empty() && !text.empty() &&
      text.back() == '\n')
    out.pop_back();
  return out;
}

std::vector<std::string> split(std::string_view s, char sep, size_t max_parts) {
  std::vector<std::string> out;
  size_t start = 0;
  for (;;) {
    if (max_parts && out.size() + 1 == max_parts) {
      out.emplace_back(s.substr(start));
      break;
    }
    size_t pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      out.emplace_back(s.substr(start));
      break;
    }
    out.emplace_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

static bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

std::vector<std::string> split_ws(std::string_view s) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && is_ws(s[i]))
      ++i;
    size_t j = i;
    while (j < s.size() && !is_ws(s[j]))
      ++j;
    if (j > i)
      out.emplace_back(s.substr(i, j - i));
    i = j;
  }
  return out;
}

std::string trim(std::string_view s) {
  while (!s.empty() && is_ws(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && is_ws(s.back()))
    s.remove_suffix(1);
  return std::string(s);
}

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.substr(s.size() - suffix.size()) == suffix;
}

bool all_digits(std::string_view s) {
  if (s.empty())
    return false;
  for (char c : s)
    if (c < '0' || c > '9')
      return false;
  return true;
}

bool is_hex(std::string_view s) {
  if (s.empty())
    return false;
  for (char c : s) {
    bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!ok)
      return false;
  }
  return true;
}

} // namespace util
} // namespace gitcli
