#pragma once

#include <string>
#include <vector>

namespace repopath {

// Split a multi-line value into trimmed, non-empty lines.
// "\r\n" and lone "\r" are treated as "\n". Surrounding whitespace is
// trimmed from every line; interior whitespace and other bytes are kept.
std::vector<std::string> split_lines(const std::string& text);

// Trim whitespace from both ends: ASCII space, \t, \n, \v, \f, \r and the
// UTF-8 encoded Unicode spaces (U+0085, U+00A0, U+2000..U+200A, U+3000, ...).
std::string trim(const std::string& s);

} // namespace repopath
