#pragma once

#include "command.hpp"

#include <optional>
#include <string>

namespace nbsrc::cli {

/**
 * Cell content options shared by update and insert.
 *
 * Sources, first one given wins:
 * - -c/--content: literal text
 * - --content-file: read from a file
 * - --stdin: read from stdin (not allowed when the notebook itself is stdin)
 */
struct ContentSource {
    std::string text;
    std::string file;
    bool from_stdin = false;
    CLI::Option* text_option = nullptr;

    void add_options(CLI::App& app) {
        text_option = app.add_option("-c,--content", text, "Cell content")
            ->type_name("<text>");

        app.add_option("--content-file", file, "Read cell content from a file")
            ->type_name("<file>");

        app.add_flag("--stdin", from_stdin, "Read cell content from stdin");
    }

    /**
     * Resolve the content.
     *
     * @param input_path The notebook input path, checked against --stdin
     * @return Content if a source was given, std::nullopt if none was,
     *         or IO_ERROR / INVALID_ARGUMENT
     */
    Result<std::optional<std::string>> resolve(const std::string& input_path) const {
        // -c "" is a valid (empty) content source
        if (text_option != nullptr && text_option->count() > 0) {
            return std::optional<std::string>(text);
        }
        if (!file.empty()) {
            auto content = read_file(file);
            if (!content.has_value()) {
                return Error(ErrorCode::IO_ERROR, "Could not read file: " + file);
            }
            return content;
        }
        if (from_stdin) {
            if (input_path == STDIN_PATH) {
                return Error(ErrorCode::INVALID_ARGUMENT,
                             "--stdin cannot be used when the notebook is read from stdin");
            }
            return std::optional<std::string>(read_stdin());
        }
        return std::optional<std::string>();
    }
};

}  // namespace nbsrc::cli
