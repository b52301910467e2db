#include <nbsrc/json_codec.hpp>
#include <nbsrc/language_detector.hpp>

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

namespace nbsrc {

using json = nlohmann::json;

nlohmann::json JsonCodec::encode(const Cells& cells, std::string_view format_tag) {
    json document;
    document["format"] = std::string(format_tag);

    json entries = json::array();
    for (const auto& cell : cells) {
        json entry;
        entry["index"] = cell.index;
        entry["content"] = cell.content;
        if (cell.language.has_value()) {
            entry["language"] = language_name(*cell.language);
        } else {
            entry["language"] = nullptr;
        }
        entries.push_back(std::move(entry));
    }
    document["cells"] = std::move(entries);
    return document;
}

Result<Cells> JsonCodec::decode(const nlohmann::json& document) {
    if (!document.is_object()) {
        return Error(ErrorCode::MALFORMED_INPUT, "Expected a JSON object");
    }
    if (document.contains("format") && !document["format"].is_string()) {
        return Error(ErrorCode::MALFORMED_INPUT, "'format' must be a string");
    }

    auto cells_it = document.find("cells");
    if (cells_it == document.end() || !cells_it->is_array()) {
        return Error(ErrorCode::MALFORMED_INPUT, "Expected a 'cells' array");
    }

    // (sort key, cell) pairs; the key is the stored index or the array position
    std::vector<std::pair<uint64_t, Cell>> entries;
    entries.reserve(cells_it->size());

    uint64_t position = 0;
    for (const auto& entry : *cells_it) {
        std::string where = "cells[" + std::to_string(position) + "]";
        if (!entry.is_object()) {
            return Error(ErrorCode::MALFORMED_INPUT, where + " is not an object");
        }

        auto content_it = entry.find("content");
        if (content_it == entry.end() || !content_it->is_string()) {
            return Error(ErrorCode::MALFORMED_INPUT, where + " has no string 'content'");
        }

        uint64_t key = position;
        auto index_it = entry.find("index");
        if (index_it != entry.end()) {
            if (!index_it->is_number_integer() || index_it->get<int64_t>() < 0) {
                return Error(ErrorCode::MALFORMED_INPUT,
                             where + " 'index' must be a non-negative integer");
            }
            key = index_it->get<uint64_t>();
        }

        Cell cell;
        cell.content = content_it->get<std::string>();

        auto language_it = entry.find("language");
        if (language_it != entry.end() && !language_it->is_null()) {
            if (!language_it->is_string()) {
                return Error(ErrorCode::MALFORMED_INPUT,
                             where + " 'language' must be a string or null");
            }
            auto name = language_it->get<std::string>();
            cell.language = parse_language(name);
            if (!cell.language.has_value()) {
                return Error(ErrorCode::MALFORMED_INPUT,
                             where + " has unrecognized language: " + name);
            }
        }

        entries.emplace_back(key, std::move(cell));
        ++position;
    }

    std::stable_sort(entries.begin(), entries.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    Cells cells;
    cells.reserve(entries.size());
    for (auto& [key, cell] : entries) {
        cell.index = cells.size();
        cells.push_back(std::move(cell));
    }
    return cells;
}

std::string JsonCodec::encode_text(const Cells& cells, std::string_view format_tag, int indent) {
    return encode(cells, format_tag).dump(indent);
}

Result<Cells> JsonCodec::decode_text(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        return Error(ErrorCode::MALFORMED_INPUT, std::string("Invalid JSON: ") + e.what());
    }
    return decode(document);
}

}  // namespace nbsrc
