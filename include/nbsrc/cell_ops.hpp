#pragma once

#include <nbsrc/result.hpp>
#include <nbsrc/types.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace nbsrc {

/**
 * Bounds-checked edits over a parsed cell sequence.
 *
 * Every edit leaves the input untouched and returns a new sequence whose
 * indices are exactly 0..n-1. Out-of-range indices fail with
 * INDEX_OUT_OF_RANGE; update and insert without content fail with
 * MISSING_CONTENT.
 */

/**
 * Get one cell.
 *
 * @param cells The cell sequence
 * @param index Cell index, valid in [0, n)
 * @return The cell, or INDEX_OUT_OF_RANGE
 */
Result<Cell> get_cell(const Cells& cells, int64_t index);

/**
 * Replace the content of one cell.
 * With a language the content is magic-wrapped and the cell re-tagged;
 * without one the existing tag is kept as is, even when the new content has
 * no magic directive (a %sql cell updated with plain text stays SQL until it
 * is parsed again).
 *
 * @param index Cell index, valid in [0, n)
 */
Result<Cells> update_cell(const Cells& cells, int64_t index,
                          const std::optional<std::string>& content,
                          std::optional<Language> language = std::nullopt);

/**
 * Insert a new cell before position index (index == n appends).
 * Without a language the new cell uses the notebook default.
 *
 * @param index Insert position, valid in [0, n]
 */
Result<Cells> insert_cell(const Cells& cells, int64_t index,
                          const std::optional<std::string>& content,
                          std::optional<Language> language = std::nullopt);

/**
 * Delete one cell.
 *
 * @param index Cell index, valid in [0, n)
 */
Result<Cells> delete_cell(const Cells& cells, int64_t index);

// Renumber cells 0..n-1 in order
void reindex(Cells& cells);

}  // namespace nbsrc
