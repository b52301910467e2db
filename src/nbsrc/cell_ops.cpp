#include <nbsrc/cell_ops.hpp>
#include <nbsrc/magic.hpp>
#include <nbsrc/util/strings.hpp>

#include <cstddef>
#include <string>

namespace nbsrc {

namespace {

// Validates index against [0, limit) and reports the bounds on failure
Result<size_t> check_index(int64_t index, size_t limit, size_t cell_count) {
    if (index < 0 || static_cast<uint64_t>(index) >= limit) {
        std::string bounds = limit == 0
            ? std::string("notebook has no cells")
            : "valid range is [0, " + std::to_string(limit - 1) + "]";
        return Err(ErrorCode::INDEX_OUT_OF_RANGE,
                     "Cell index " + std::to_string(index) + " out of range (" + bounds +
                     ", " + std::to_string(cell_count) + " cells)");
    }
    return static_cast<size_t>(index);
}

std::string prepare_content(const std::string& content, std::optional<Language> language) {
    std::string trimmed = util::trim(content);
    if (!language.has_value()) {
        return trimmed;
    }
    return MagicWrapper::wrap(trimmed, *language);
}

}  // namespace

void reindex(Cells& cells) {
    for (size_t i = 0; i < cells.size(); ++i) {
        cells[i].index = i;
    }
}

Result<Cell> get_cell(const Cells& cells, int64_t index) {
    auto pos = check_index(index, cells.size(), cells.size());
    if (!pos.ok()) {
        return pos.error();
    }
    return cells[*pos];
}

Result<Cells> update_cell(const Cells& cells, int64_t index,
                          const std::optional<std::string>& content,
                          std::optional<Language> language) {
    auto pos = check_index(index, cells.size(), cells.size());
    if (!pos.ok()) {
        return pos.error();
    }
    if (!content.has_value()) {
        return Err(ErrorCode::MISSING_CONTENT, "No content given for cell update");
    }

    Cells updated = cells;
    Cell& cell = updated[*pos];
    cell.content = prepare_content(*content, language);
    if (language.has_value()) {
        cell.language = language;
    }
    reindex(updated);
    return updated;
}

Result<Cells> insert_cell(const Cells& cells, int64_t index,
                          const std::optional<std::string>& content,
                          std::optional<Language> language) {
    auto pos = check_index(index, cells.size() + 1, cells.size());
    if (!pos.ok()) {
        return pos.error();
    }
    if (!content.has_value()) {
        return Err(ErrorCode::MISSING_CONTENT, "No content given for new cell");
    }

    Cell cell;
    cell.content = prepare_content(*content, language);
    cell.language = language;

    Cells updated = cells;
    updated.insert(updated.begin() + static_cast<std::ptrdiff_t>(*pos), std::move(cell));
    reindex(updated);
    return updated;
}

Result<Cells> delete_cell(const Cells& cells, int64_t index) {
    auto pos = check_index(index, cells.size(), cells.size());
    if (!pos.ok()) {
        return pos.error();
    }

    Cells updated = cells;
    updated.erase(updated.begin() + static_cast<std::ptrdiff_t>(*pos));
    reindex(updated);
    return updated;
}

}  // namespace nbsrc
