#include <nbsrc/language_detector.hpp>
#include <nbsrc/util/strings.hpp>

#include <unordered_map>

namespace nbsrc {

namespace {

// Directive token to language mapping
const std::unordered_map<std::string, Language> DIRECTIVE_MAP = {
    {"python", Language::PYTHON},
    {"sql", Language::SQL},
    {"scala", Language::SCALA},
    {"r", Language::R},
    {"md", Language::MD},
    {"sh", Language::SH},
    {"run", Language::RUN},
    {"pip", Language::PIP},
    {"fs", Language::FS},
};

}  // namespace

std::optional<Language> LanguageDetector::detect(const std::string& content) {
    size_t line_end = content.find('\n');
    if (line_end == std::string::npos) {
        line_end = content.length();
    }

    auto token = directive_token(std::string_view(content).substr(0, line_end));
    if (!token.has_value()) {
        return std::nullopt;
    }
    return parse_language(*token);
}

std::optional<std::string> LanguageDetector::directive_token(std::string_view first_line) {
    if (!util::starts_with(first_line, MAGIC_PREFIX)) {
        return std::nullopt;
    }

    std::string_view rest = first_line.substr(MAGIC_PREFIX.size());
    if (rest.empty() || rest[0] != DIRECTIVE_CHAR) {
        return std::nullopt;
    }

    // Token runs from after '%' to the next whitespace
    rest.remove_prefix(1);
    size_t token_end = rest.find_first_of(util::WHITESPACE);
    if (token_end == std::string_view::npos) {
        token_end = rest.length();
    }
    return std::string(rest.substr(0, token_end));
}

const char* language_name(Language language) {
    switch (language) {
        case Language::PYTHON: return "python";
        case Language::SQL: return "sql";
        case Language::SCALA: return "scala";
        case Language::R: return "r";
        case Language::MD: return "md";
        case Language::SH: return "sh";
        case Language::FS: return "fs";
        case Language::RUN: return "run";
        case Language::PIP: return "pip";
    }
    return "unknown";
}

const char* language_name(WrapLanguage language) {
    switch (language) {
        case WrapLanguage::MD: return "md";
        case WrapLanguage::SQL: return "sql";
        case WrapLanguage::SCALA: return "scala";
        case WrapLanguage::R: return "r";
        case WrapLanguage::SH: return "sh";
        case WrapLanguage::FS: return "fs";
        case WrapLanguage::RUN: return "run";
        case WrapLanguage::PIP: return "pip";
    }
    return "unknown";
}

std::optional<Language> parse_language(std::string_view name) {
    auto it = DIRECTIVE_MAP.find(std::string(name));
    if (it != DIRECTIVE_MAP.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<WrapLanguage> wrap_language_for(Language language) {
    switch (language) {
        case Language::PYTHON: return std::nullopt;
        case Language::SQL: return WrapLanguage::SQL;
        case Language::SCALA: return WrapLanguage::SCALA;
        case Language::R: return WrapLanguage::R;
        case Language::MD: return WrapLanguage::MD;
        case Language::SH: return WrapLanguage::SH;
        case Language::FS: return WrapLanguage::FS;
        case Language::RUN: return WrapLanguage::RUN;
        case Language::PIP: return WrapLanguage::PIP;
    }
    return std::nullopt;
}

}  // namespace nbsrc
