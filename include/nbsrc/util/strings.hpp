#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace nbsrc::util {

constexpr std::string_view WHITESPACE = " \t\n\r\f\v";

inline std::string trim(std::string_view s) {
    size_t start = s.find_first_not_of(WHITESPACE);
    if (start == std::string_view::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(WHITESPACE);
    return std::string(s.substr(start, end - start + 1));
}

inline bool is_blank(std::string_view s) {
    return s.find_first_not_of(WHITESPACE) == std::string_view::npos;
}

inline bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

/**
 * Split text into lines on '\n'.
 * A trailing newline does not produce an extra empty line, and empty text
 * has no lines.
 */
inline std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos) {
            lines.emplace_back(text.substr(pos));
            break;
        }
        lines.emplace_back(text.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return lines;
}

inline std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

}  // namespace nbsrc::util
