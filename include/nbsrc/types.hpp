#pragma once

#include <nbsrc/core_types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace nbsrc {

/**
 * One logical unit of notebook content.
 */
struct Cell {
    size_t index = 0;
    std::string content;               // Trimmed, never holds a delimiter line
    std::optional<Language> language;  // nullopt inherits the notebook default

    bool operator==(const Cell& other) const {
        return index == other.index && content == other.content &&
               language == other.language;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

using Cells = std::vector<Cell>;

/**
 * Rendering options, filled from the command line.
 */
struct Config {
    bool include_header = true;
    std::string format_tag = std::string(SOURCE_FORMAT_TAG);
    bool verbose = false;
};

}  // namespace nbsrc
