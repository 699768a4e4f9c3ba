#pragma once
#include <string>

namespace gitcli {

// Re-encodes `bytes` from `from_encoding` (an iconv name) to UTF-8.
// Undecodable input is replaced with U+FFFD. Throws ArgumentError if the
// encoding is unknown to iconv.
std::string normalize_encoding(const std::string &bytes,
                               const std::string &from_encoding = "UTF-8");

// Throws ArgumentError if iconv cannot convert from `from_encoding`.
void check_encoding(const std::string &from_encoding);

bool valid_utf8(const std::string &s);

} // namespace gitcli
