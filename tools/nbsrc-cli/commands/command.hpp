#pragma once

#include "exit_codes.hpp"

#include <nbsrc/nbsrc.hpp>
#include <nbsrc/util/logger.hpp>
#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace nbsrc::cli {

// Path argument meaning "read stdin"
constexpr const char* STDIN_PATH = "-";

/**
 * Context passed to command execution.
 * Holds the rendering config and the logger.
 */
struct CommandContext {
    Config config;
    Logger* logger = &null_logger();
    std::string input_format;    // "source", "json" or empty for auto-detect
    std::string output_format;   // "source", "json" or empty for the default
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with config and logger
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;

    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Read entire file content.
 * @return File content if successful, std::nullopt on error
 */
inline std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.fail() && !file.eof()) {
        return std::nullopt;  // Read error occurred
    }
    return ss.str();
}

/**
 * Read from stdin until EOF.
 */
inline std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

inline Result<void> write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Could not open for writing: " + path.string());
    }
    file << content;
    file.flush();
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Write failed: " + path.string());
    }
    return Ok();
}

/**
 * Read an input path, "-" meaning stdin.
 */
inline Result<std::string> read_input(const std::string& path) {
    if (path == STDIN_PATH) {
        return read_stdin();
    }
    auto content = read_file(path);
    if (!content.has_value()) {
        return Error(ErrorCode::IO_ERROR, "Could not read file: " + path);
    }
    return std::move(*content);
}

inline NotebookFormat resolve_input_format(const CommandContext& ctx, const std::string& path) {
    return input_format_for(parse_format(ctx.input_format), path);
}

/**
 * Load a notebook from SOURCE text or its JSON document.
 *
 * @param ctx Execution context (selects the input format)
 * @param path Input path or "-"
 * @return Parsed cells, or IO_ERROR / MALFORMED_INPUT
 */
inline Result<Cells> load_notebook(CommandContext& ctx, const std::string& path) {
    auto text = read_input(path);
    if (!text.ok()) {
        return text.error();
    }

    if (resolve_input_format(ctx, path) == NotebookFormat::JSON) {
        ctx.logger->debug("Decoding JSON notebook from " + path);
        return JsonCodec::decode_text(text.value());
    }

    ctx.logger->debug("Parsing SOURCE notebook from " + path);
    Cells cells = CellSplitter::split(text.value());
    ctx.logger->debug("Parsed " + std::to_string(cells.size()) + " cells");
    return cells;
}

/**
 * Write a rendered notebook to output_path, or to stdout when it is empty.
 * Writing over the input keeps the input's format unless --output-format
 * was given.
 */
inline int emit_notebook(CommandContext& ctx, const Cells& cells,
                         const std::string& input_path, const std::string& output_path) {
    bool in_place = !output_path.empty() && output_path == input_path;
    NotebookFormat format = output_format_for(parse_format(ctx.output_format),
                                              resolve_input_format(ctx, input_path), in_place);
    ctx.logger->debug(std::string("Rendering notebook as ") + format_name(format));

    std::string rendered = render(cells, format, ctx.config);
    if (!rendered.empty() && rendered.back() != '\n') {
        rendered += '\n';
    }

    if (output_path.empty()) {
        std::cout << rendered;
        return NBSRC_EXIT_SUCCESS;
    }

    auto result = write_file(output_path, rendered);
    if (!result.ok()) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return exit_code_for(result.error());
    }
    ctx.logger->info("Wrote " + std::to_string(cells.size()) + " cells to " + output_path);
    return NBSRC_EXIT_SUCCESS;
}

/**
 * Print an error to stderr and return its exit code.
 */
inline int report_error(const Error& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    return exit_code_for(error);
}

/**
 * Resolve a --lang value. Empty means "no language given".
 */
inline Result<std::optional<Language>> resolve_language(const std::string& name) {
    if (name.empty()) {
        return std::optional<Language>();
    }
    auto language = parse_language(name);
    if (!language.has_value()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Unknown language: " + name);
    }
    return language;
}

/**
 * Truncate a string for display, adding "..." if needed.
 *
 * @param s The string to truncate
 * @param max_len Maximum length (including "..." if truncated)
 * @return Truncated string
 */
inline std::string truncate(const std::string& s, size_t max_len) {
    if (max_len <= 3) return s.substr(0, max_len);
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len - 3) + "...";
}

}  // namespace nbsrc::cli
