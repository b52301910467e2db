#pragma once

#include <nbsrc/types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace nbsrc {

/**
 * CellSplitter - Splits notebook SOURCE text into cells.
 *
 * Splitting rules:
 * 1. A leading header line is removed together with the blank lines after it.
 *    If the remaining text opens with a delimiter line, that delimiter closes
 *    the header block and the empty gap before it is not a cell.
 * 2. The text is split on lines that are exactly the cell delimiter.
 * 3. Segments are trimmed. Empty segments are dropped, except the first one,
 *    which is always kept so a notebook can start with an empty cell.
 * 4. Surviving segments are numbered from zero and language-tagged.
 *
 * Any text is accepted; text without delimiters is a single-cell notebook.
 */
class CellSplitter {
public:
    static Cells split(std::string_view text);

private:
    // Returns true and advances text past the header block if present
    static bool strip_header(std::string_view& text);

    static std::vector<std::string> split_segments(std::string_view text);
};

// Convenience alias for CellSplitter::split
inline Cells parse(std::string_view text) { return CellSplitter::split(text); }

}  // namespace nbsrc
