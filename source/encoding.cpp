#include <gitcli/encoding.hpp>
#include <gitcli/errors.hpp>

#include <iconv.h>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <vector>

namespace gitcli {

static const char kReplacement[] = "\xEF\xBF\xBD";

// length of the valid UTF-8 sequence at s[i], 0 if invalid
static size_t utf8_seq_len(const std::string &s, size_t i) {
  auto b = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
  unsigned char c = b(i);
  size_t n = 0;
  if (c < 0x80) return 1;
  if (c >= 0xC2 && c <= 0xDF) n = 2;
  else if (c >= 0xE0 && c <= 0xEF) n = 3;
  else if (c >= 0xF0 && c <= 0xF4) n = 4;
  else return 0;
  if (i + n > s.size()) return 0;
  for (size_t k = 1; k < n; ++k)
    if ((b(i + k) & 0xC0) != 0x80) return 0;
  if (n == 3) {
    if (c == 0xE0 && b(i + 1) < 0xA0) return 0;
    if (c == 0xED && b(i + 1) > 0x9F) return 0;
  }
  if (n == 4) {
    if (c == 0xF0 && b(i + 1) < 0x90) return 0;
    if (c == 0xF4 && b(i + 1) > 0x8F) return 0;
  }
  return n;
}

bool valid_utf8(const std::string &s) {
  for (size_t i = 0; i < s.size();) {
    size_t n = utf8_seq_len(s, i);
    if (n == 0) return false;
    i += n;
  }
  return true;
}

static std::string scrub_utf8(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size();) {
    size_t n = utf8_seq_len(s, i);
    if (n == 0) {
      out += kReplacement;
      ++i;
    } else {
      out.append(s, i, n);
      i += n;
    }
  }
  return out;
}

static bool is_utf8_name(std::string e) {
  for (auto &ch : e) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  return e == "UTF-8" || e == "UTF8";
}

namespace {

class Converter {
public:
  explicit Converter(const std::string &from)
      : cd_(::iconv_open("UTF-8", from.c_str())) {
    if (cd_ == reinterpret_cast<iconv_t>(-1))
      throw ArgumentError("unsupported encoding: " + from);
  }
  ~Converter() { ::iconv_close(cd_); }
  Converter(const Converter &) = delete;
  Converter &operator=(const Converter &) = delete;

  iconv_t get() const { return cd_; }

private:
  iconv_t cd_;
};

} // namespace

void check_encoding(const std::string &from_encoding) {
  if (!is_utf8_name(from_encoding))
    Converter conv(from_encoding);
}

std::string normalize_encoding(const std::string &bytes,
                               const std::string &from_encoding) {
  if (is_utf8_name(from_encoding))
    return valid_utf8(bytes) ? bytes : scrub_utf8(bytes);

  Converter conv(from_encoding);
  iconv_t cd = conv.get();

  std::string out;
  out.reserve(bytes.size() * 2);
  std::vector<char> buf(4096);
  char *in = const_cast<char *>(bytes.data());
  size_t in_left = bytes.size();

  while (in_left > 0) {
    char *op = buf.data();
    size_t out_left = buf.size();
    size_t rc = ::iconv(cd, &in, &in_left, &op, &out_left);
    out.append(buf.data(), buf.size() - out_left);
    if (rc != static_cast<size_t>(-1))
      continue;
    if (errno == E2BIG)
      continue;
    // EILSEQ / EINVAL: skip one byte
    out += kReplacement;
    ++in;
    --in_left;
    ::iconv(cd, nullptr, nullptr, nullptr, nullptr);
  }
  char *op = buf.data();
  size_t out_left = buf.size();
  ::iconv(cd, nullptr, nullptr, &op, &out_left);
  out.append(buf.data(), buf.size() - out_left);
  return out;
}

} // namespace gitcli
