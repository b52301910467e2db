#pragma once

/**
 * nbsrc - notebook SOURCE toolkit
 *
 * Parses notebook source text into cells, edits cells by index and renders
 * the result back to source text or JSON.
 */

#include <nbsrc/types.hpp>
#include <nbsrc/result.hpp>
#include <nbsrc/language_detector.hpp>
#include <nbsrc/cell_splitter.hpp>
#include <nbsrc/magic.hpp>
#include <nbsrc/serializer.hpp>
#include <nbsrc/json_codec.hpp>
#include <nbsrc/cell_ops.hpp>
#include <nbsrc/notebook_format.hpp>
