#include <nbsrc/cell_splitter.hpp>
#include <nbsrc/language_detector.hpp>
#include <nbsrc/util/strings.hpp>

namespace nbsrc {

Cells CellSplitter::split(std::string_view text) {
    bool had_header = strip_header(text);

    std::vector<std::string> segments = split_segments(text);

    // Header immediately followed by a delimiter: the gap belongs to the header
    if (had_header && segments.size() > 1 && util::is_blank(segments.front())) {
        segments.erase(segments.begin());
    }

    Cells cells;
    cells.reserve(segments.size());
    for (size_t i = 0; i < segments.size(); ++i) {
        std::string content = util::trim(segments[i]);
        if (content.empty() && i > 0) {
            continue;
        }

        Cell cell;
        cell.index = cells.size();
        cell.language = LanguageDetector::detect(content);
        cell.content = std::move(content);
        cells.push_back(std::move(cell));
    }
    return cells;
}

bool CellSplitter::strip_header(std::string_view& text) {
    size_t line_end = text.find('\n');
    std::string_view first_line = text.substr(0, line_end);
    if (first_line != NOTEBOOK_HEADER) {
        return false;
    }

    text = line_end == std::string_view::npos ? std::string_view() : text.substr(line_end + 1);

    // Skip blank lines following the header
    while (!text.empty()) {
        size_t nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        if (!util::is_blank(line)) {
            break;
        }
        text = nl == std::string_view::npos ? std::string_view() : text.substr(nl + 1);
    }
    return true;
}

std::vector<std::string> CellSplitter::split_segments(std::string_view text) {
    std::vector<std::string> segments;
    std::vector<std::string> current;

    for (auto& line : util::split_lines(text)) {
        if (line == CELL_DELIMITER) {
            segments.push_back(util::join_lines(current));
            current.clear();
        } else {
            current.push_back(std::move(line));
        }
    }
    segments.push_back(util::join_lines(current));
    return segments;
}

}  // namespace nbsrc
