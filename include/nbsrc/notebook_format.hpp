#pragma once

#include <nbsrc/types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace nbsrc {

// On-disk representation of a notebook
enum class NotebookFormat {
    SOURCE,
    JSON
};

const char* format_name(NotebookFormat format);

// Parse "source" / "json"; std::nullopt for anything else
std::optional<NotebookFormat> parse_format(std::string_view name);

/**
 * Format of an input notebook.
 * An explicit format wins; otherwise *.json files are JSON and everything
 * else (stdin included) is SOURCE.
 */
NotebookFormat input_format_for(std::optional<NotebookFormat> requested,
                                const std::string& path);

/**
 * Format to write a notebook in.
 * An explicit format wins. A notebook written back over its input keeps the
 * input's format; any other output defaults to SOURCE.
 */
NotebookFormat output_format_for(std::optional<NotebookFormat> requested,
                                 NotebookFormat input_format,
                                 bool in_place);

// Render cells in the given format
std::string render(const Cells& cells, NotebookFormat format, const Config& config);

}  // namespace nbsrc
