#pragma once

#include <nbsrc/core_types.hpp>

#include <string>

namespace nbsrc {

/**
 * Converts cell content between plain text and its magic-wrapped form.
 *
 *   SELECT 1          # MAGIC %sql
 *                 <-> # MAGIC SELECT 1
 *   FROM t            # MAGIC
 *                     # MAGIC FROM t
 */
class MagicWrapper {
public:
    /**
     * Wrap content for a wrap-eligible language: a directive line followed by
     * every content line behind the magic prefix. Empty lines become the bare
     * magic marker.
     */
    static std::string wrap(const std::string& content, WrapLanguage language);

    /**
     * Wrap content if the language is wrap-eligible; otherwise (PYTHON) the
     * content is returned unchanged.
     */
    static std::string wrap(const std::string& content, Language language);
};

class MagicUnwrapper {
public:
    /**
     * Strip magic prefixes, turn bare markers into empty lines, drop a leading
     * directive line and trim the result. Lines without the prefix pass
     * through unchanged.
     */
    static std::string unwrap(const std::string& content);
};

}  // namespace nbsrc
