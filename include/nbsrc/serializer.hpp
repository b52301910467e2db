#pragma once

#include <nbsrc/types.hpp>

#include <string>

namespace nbsrc {

/**
 * NotebookSerializer - Renders a cell sequence as notebook SOURCE text.
 *
 * Every block after the first one is preceded by a blank line, the delimiter
 * line and another blank line. With the header enabled the header is the
 * first block, so the output reads:
 *
 *   # Databricks notebook source
 *
 *   # COMMAND ----------
 *
 *   <cell 0>
 *
 *   # COMMAND ----------
 *
 *   <cell 1>
 *
 * Without the header the first cell's content is the first line, unless that
 * content itself opens with the header line; then the header is written
 * anyway so the cell is not mistaken for it on the next parse.
 */
class NotebookSerializer {
public:
    static std::string serialize(const Cells& cells, bool include_header = true);
};

inline std::string serialize(const Cells& cells, bool include_header = true) {
    return NotebookSerializer::serialize(cells, include_header);
}

}  // namespace nbsrc
