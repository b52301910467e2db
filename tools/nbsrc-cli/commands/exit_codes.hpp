#pragma once

#include <nbsrc/result.hpp>

namespace nbsrc::cli {

// Standard exit codes for CLI commands
// Named with NBSRC_ prefix to avoid conflict with system macros
constexpr int NBSRC_EXIT_SUCCESS = 0;
constexpr int NBSRC_EXIT_USER_ERROR = 1;     // Invalid arguments, missing content, bad JSON
constexpr int NBSRC_EXIT_OUT_OF_RANGE = 2;   // Cell index outside the notebook
constexpr int NBSRC_EXIT_IO_ERROR = 3;       // File read/write errors
constexpr int NBSRC_EXIT_INTERNAL = 4;       // Internal/unexpected errors

inline int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::OK:
            return NBSRC_EXIT_SUCCESS;
        case ErrorCode::INDEX_OUT_OF_RANGE:
            return NBSRC_EXIT_OUT_OF_RANGE;
        case ErrorCode::MISSING_CONTENT:
        case ErrorCode::MALFORMED_INPUT:
        case ErrorCode::INVALID_ARGUMENT:
            return NBSRC_EXIT_USER_ERROR;
        case ErrorCode::IO_ERROR:
            return NBSRC_EXIT_IO_ERROR;
        case ErrorCode::INTERNAL_ERROR:
            return NBSRC_EXIT_INTERNAL;
    }
    return NBSRC_EXIT_INTERNAL;
}

}  // namespace nbsrc::cli
