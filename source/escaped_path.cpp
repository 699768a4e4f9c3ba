#include <gitcli/escaped_path.hpp>

namespace gitcli {

static int unescape_char(char c) {
  switch (c) {
  case 'a': return 0x07;
  case 'b': return 0x08;
  case 't': return 0x09;
  case 'n': return 0x0a;
  case 'v': return 0x0b;
  case 'f': return 0x0c;
  case 'r': return 0x0d;
  case 'e': return 0x1b;
  case '\\': return 0x5c;
  case '"': return 0x22;
  case '\'': return 0x27;
  default: return -1;
  }
}

static bool is_octal(char c) { return c >= '0' && c <= '7'; }

std::string unescape_path(std::string_view in) {
  std::string bytes;
  bytes.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    char c = in[i];
    if (c == '\\' && i + 1 < in.size()) {
      char n = in[i + 1];
      if (is_octal(n)) {
        // up to three digits, the tool always emits exactly three
        int v = 0;
        size_t j = i + 1;
        while (j < in.size() && j < i + 4 && is_octal(in[j])) {
          v = v * 8 + (in[j] - '0');
          ++j;
        }
        bytes.push_back(static_cast<char>(v & 0xff));
        i = j;
        continue;
      }
      int u = unescape_char(n);
      if (u >= 0) {
        bytes.push_back(static_cast<char>(u));
        i += 2;
        continue;
      }
    }
    bytes.push_back(c);
    ++i;
  }
  return bytes;
}

bool is_quoted(std::string_view token) {
  return token.size() >= 2 && token.front() == '"' && token.back() == '"';
}

std::string unquote_path(std::string_view token) {
  if (!is_quoted(token))
    return std::string(token);
  return unescape_path(token.substr(1, token.size() - 2));
}

} // namespace gitcli
