#include "repopath/text_lines.hpp"

#include <cstring>
#include <sstream>
#include <utility>

namespace repopath {

namespace {

constexpr const char* kAsciiSpace = " \t\n\v\f\r";

// UTF-8 encodings of the non-ASCII Unicode White_Space characters.
constexpr const char* kUnicodeSpace[] = {
    "\xC2\x85",                                      // U+0085 NEL
    "\xC2\xA0",                                      // U+00A0 NO-BREAK SPACE
    "\xE1\x9A\x80",                                  // U+1680
    "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83",
    "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
    "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",  // U+2000..U+200A
    "\xE2\x80\xA8", "\xE2\x80\xA9",                  // U+2028, U+2029
    "\xE2\x80\xAF",                                  // U+202F
    "\xE2\x81\x9F",                                  // U+205F
    "\xE3\x80\x80",                                  // U+3000
};

// Byte length of the whitespace character starting at pos, or 0.
size_t space_length_at(const std::string& s, size_t pos) {
    if (s[pos] != '\0' && std::strchr(kAsciiSpace, s[pos]) != nullptr) {
        return 1;
    }
    for (const char* u : kUnicodeSpace) {
        size_t len = std::strlen(u);
        if (s.compare(pos, len, u) == 0) {
            return len;
        }
    }
    return 0;
}

// Byte length of the whitespace character ending at end, or 0.
// Never reaches before floor.
size_t space_length_before(const std::string& s, size_t end, size_t floor) {
    for (size_t len = 1; len <= 3 && len <= end - floor; ++len) {
        size_t n = space_length_at(s, end - len);
        if (n == len) {
            return len;
        }
    }
    return 0;
}

std::string normalize_line_endings(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                continue;  // the '\n' that follows ends the line
            }
            c = '\n';
        }
        out += c;
    }
    return out;
}

} // namespace

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end) {
        size_t n = space_length_at(s, start);
        if (n == 0) break;
        start += n;
    }
    while (end > start) {
        size_t n = space_length_before(s, end, start);
        if (n == 0) break;
        end -= n;
    }
    return s.substr(start, end - start);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    if (text.empty()) {
        return lines;
    }

    std::istringstream ss(normalize_line_endings(text));
    std::string line;
    while (std::getline(ss, line, '\n')) {
        std::string trimmed = trim(line);
        if (!trimmed.empty()) {
            lines.push_back(std::move(trimmed));
        }
    }
    return lines;
}

} // namespace repopath
