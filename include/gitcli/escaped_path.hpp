#pragma once
#include <string>
#include <string_view>

namespace gitcli {

// Decodes the body of a quoted path as git prints it with
// core.quotePath=true: C escapes plus \NNN octal bytes. The result is the
// raw byte sequence (UTF-8 for any sane repository).
std::string unescape_path(std::string_view escaped);

// Strips the surrounding double quotes and unescapes; unquoted tokens are
// returned unchanged.
std::string unquote_path(std::string_view token);

bool is_quoted(std::string_view token);

} // namespace gitcli
