#include <nbsrc/notebook_format.hpp>
#include <nbsrc/json_codec.hpp>
#include <nbsrc/serializer.hpp>

#include <filesystem>

namespace nbsrc {

const char* format_name(NotebookFormat format) {
    switch (format) {
        case NotebookFormat::SOURCE: return "source";
        case NotebookFormat::JSON: return "json";
    }
    return "unknown";
}

std::optional<NotebookFormat> parse_format(std::string_view name) {
    if (name == "source") return NotebookFormat::SOURCE;
    if (name == "json") return NotebookFormat::JSON;
    return std::nullopt;
}

NotebookFormat input_format_for(std::optional<NotebookFormat> requested,
                                const std::string& path) {
    if (requested.has_value()) {
        return *requested;
    }
    if (path != "-" && std::filesystem::path(path).extension() == ".json") {
        return NotebookFormat::JSON;
    }
    return NotebookFormat::SOURCE;
}

NotebookFormat output_format_for(std::optional<NotebookFormat> requested,
                                 NotebookFormat input_format,
                                 bool in_place) {
    if (requested.has_value()) {
        return *requested;
    }
    return in_place ? input_format : NotebookFormat::SOURCE;
}

std::string render(const Cells& cells, NotebookFormat format, const Config& config) {
    if (format == NotebookFormat::JSON) {
        return JsonCodec::encode_text(cells, config.format_tag);
    }
    return NotebookSerializer::serialize(cells, config.include_header);
}

}  // namespace nbsrc
