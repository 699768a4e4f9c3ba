#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace gitcli {
namespace util {

// Splits on '\n', dropping a trailing '\r' from each line. With
// skip_empty, blank lines are not returned.
std::vector<std::string> split_lines(std::string_view text, bool skip_empty = true);

// At most max_parts pieces (0 = unlimited); the last keeps the remainder.
std::vector<std::string> split(std::string_view s, char sep, size_t max_parts = 0);

// Whitespace-separated fields.
std::vector<std::string> split_ws(std::string_view s);

std::string trim(std::string_view s);

bool starts_with(std::string_view s, std::string_view prefix);
bool ends_with(std::string_view s, std::string_view suffix);

bool all_digits(std::string_view s);
bool is_hex(std::string_view s);

} // namespace util
} // namespace gitcli
