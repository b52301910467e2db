#include <nbsrc/serializer.hpp>
#include <nbsrc/util/strings.hpp>

#include <string_view>
#include <vector>

namespace nbsrc {

namespace {

bool opens_with_header(const Cells& cells) {
    if (cells.empty()) {
        return false;
    }
    const std::string& content = cells.front().content;
    return std::string_view(content).substr(0, content.find('\n')) == NOTEBOOK_HEADER;
}

}  // namespace

std::string NotebookSerializer::serialize(const Cells& cells, bool include_header) {
    std::vector<std::string> parts;
    parts.reserve(cells.size() * 4 + 1);

    // A first cell opening with the header line would be read back as the
    // header, so the header is written regardless.
    bool emit_header = include_header || opens_with_header(cells);

    if (emit_header) {
        parts.emplace_back(NOTEBOOK_HEADER);
    }

    for (const auto& cell : cells) {
        if (!parts.empty()) {
            parts.emplace_back();
            parts.emplace_back(CELL_DELIMITER);
            parts.emplace_back();
        }
        parts.push_back(cell.content);
    }

    return util::join_lines(parts);
}

}  // namespace nbsrc
