#pragma once

#include <cstdint>
#include <string_view>

namespace nbsrc {

// Literal SOURCE format markers. These must match the notebook store byte for byte.
constexpr std::string_view NOTEBOOK_HEADER = "# Databricks notebook source";
constexpr std::string_view CELL_DELIMITER = "# COMMAND ----------";
constexpr std::string_view MAGIC_PREFIX = "# MAGIC ";   // note trailing space
constexpr std::string_view MAGIC_MARKER = "# MAGIC";    // prefix of an empty wrapped line
constexpr char DIRECTIVE_CHAR = '%';

// Format tag written to the JSON representation
constexpr std::string_view SOURCE_FORMAT_TAG = "SOURCE";

// Languages a magic directive on a cell's first line may name
enum class Language : uint8_t {
    PYTHON,
    SQL,
    SCALA,
    R,
    MD,
    SH,
    FS,
    RUN,
    PIP
};

// Languages whose content is written with per-line magic markers.
// PYTHON is intentionally absent: it is expressible as the notebook's
// default language and is never wrapped.
enum class WrapLanguage : uint8_t {
    MD,
    SQL,
    SCALA,
    R,
    SH,
    FS,
    RUN,
    PIP
};

}  // namespace nbsrc
