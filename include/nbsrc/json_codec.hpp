#pragma once

#include <nbsrc/result.hpp>
#include <nbsrc/types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace nbsrc {

/**
 * JsonCodec - Maps a cell sequence to and from its JSON document.
 *
 *   { "format": "SOURCE",
 *     "cells": [ { "index": 0, "content": "...", "language": "sql" | null } ] }
 *
 * Decoding trusts the stored language and never re-runs detection.
 */
class JsonCodec {
public:
    static nlohmann::json encode(const Cells& cells,
                                 std::string_view format_tag = SOURCE_FORMAT_TAG);

    /**
     * Decode a JSON document.
     *
     * A missing index defaults to the entry's position and a missing or null
     * language to the default language. Entries are stable-sorted by their
     * stored index, so that index decides the order rather than the array
     * position (entries with equal indices keep array order). The result is
     * then renumbered from zero.
     *
     * @return The cell sequence, or MALFORMED_INPUT
     */
    static Result<Cells> decode(const nlohmann::json& document);

    // Render as indented JSON text
    static std::string encode_text(const Cells& cells,
                                   std::string_view format_tag = SOURCE_FORMAT_TAG,
                                   int indent = 2);

    // Parse JSON text and decode it; parse failures are MALFORMED_INPUT
    static Result<Cells> decode_text(const std::string& text);
};

inline nlohmann::json cells_to_json(const Cells& cells) { return JsonCodec::encode(cells); }
inline Result<Cells> cells_from_json(const nlohmann::json& document) {
    return JsonCodec::decode(document);
}

}  // namespace nbsrc
