#pragma once

#include <nbsrc/core_types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace nbsrc {

/**
 * Detects the embedded language of a notebook cell from its magic directive.
 *
 * Only the first line is examined. A cell is tagged when that line reads
 * "# MAGIC %<token>" and <token> is a recognized language; anything else,
 * including a directive on a later line, leaves the cell on the notebook's
 * default language.
 */
class LanguageDetector {
public:
    /**
     * Detect the language of a cell.
     *
     * @param content The cell content (already trimmed)
     * @return Recognized language, or std::nullopt for the default language
     */
    static std::optional<Language> detect(const std::string& content);

private:
    static std::optional<std::string> directive_token(std::string_view first_line);
};

// Lowercase token name of a language ("python", "sql", ...)
const char* language_name(Language language);
const char* language_name(WrapLanguage language);

// Parse a token name; std::nullopt if it is not a recognized language
std::optional<Language> parse_language(std::string_view name);

// Wrap-eligible counterpart of a language; std::nullopt for PYTHON
std::optional<WrapLanguage> wrap_language_for(Language language);

}  // namespace nbsrc
