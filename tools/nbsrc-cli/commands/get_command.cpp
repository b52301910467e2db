#include "get_command.hpp"

namespace nbsrc::cli {

void GetCommand::setup(CLI::App& app) {
    app.add_option("input", input_, "Notebook file ('-' for stdin)")
        ->required()
        ->type_name("<file>");

    app.add_option("index", index_, "Cell index")
        ->required()
        ->type_name("<index>");

    app.add_flag("--raw", raw_, "Output content only, no headers");

    app.add_flag("--unwrap", unwrap_, "Strip magic markers from the content");
}

int GetCommand::execute(CommandContext& ctx) {
    auto cells_result = load_notebook(ctx, input_);
    if (!cells_result.ok()) {
        return report_error(cells_result.error());
    }

    auto cell_result = get_cell(cells_result.value(), index_);
    if (!cell_result.ok()) {
        return report_error(cell_result.error());
    }

    auto& cell = cell_result.value();
    std::string content = unwrap_ ? MagicUnwrapper::unwrap(cell.content) : cell.content;

    if (!raw_) {
        const char* lang = cell.language.has_value() ? language_name(*cell.language) : "default";
        std::cout << "# Cell " << cell.index << " [" << lang << "]\n\n";
    }

    std::cout << content;

    // Ensure trailing newline
    if (!content.empty() && content.back() != '\n') {
        std::cout << "\n";
    }

    return NBSRC_EXIT_SUCCESS;
}

}  // namespace nbsrc::cli
