#include <nbsrc/magic.hpp>
#include <nbsrc/language_detector.hpp>
#include <nbsrc/util/strings.hpp>

#include <vector>

namespace nbsrc {

std::string MagicWrapper::wrap(const std::string& content, WrapLanguage language) {
    std::vector<std::string> lines;
    lines.push_back(std::string(MAGIC_PREFIX) + DIRECTIVE_CHAR + language_name(language));

    for (const auto& line : util::split_lines(content)) {
        if (line.empty()) {
            lines.emplace_back(MAGIC_MARKER);
        } else {
            lines.push_back(std::string(MAGIC_PREFIX) + line);
        }
    }
    return util::join_lines(lines);
}

std::string MagicWrapper::wrap(const std::string& content, Language language) {
    auto wrap_language = wrap_language_for(language);
    if (!wrap_language.has_value()) {
        return content;
    }
    return wrap(content, *wrap_language);
}

std::string MagicUnwrapper::unwrap(const std::string& content) {
    std::vector<std::string> lines;
    for (const auto& line : util::split_lines(content)) {
        if (util::starts_with(line, MAGIC_PREFIX)) {
            lines.push_back(line.substr(MAGIC_PREFIX.size()));
        } else if (line == MAGIC_MARKER) {
            lines.emplace_back();
        } else {
            lines.push_back(line);
        }
    }

    // Leftover directive token
    if (!lines.empty() && !lines.front().empty() && lines.front()[0] == DIRECTIVE_CHAR) {
        lines.erase(lines.begin());
    }

    return util::trim(util::join_lines(lines));
}

}  // namespace nbsrc
