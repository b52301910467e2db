#include "insert_command.hpp"

namespace nbsrc::cli {

void InsertCommand::setup(CLI::App& app) {
    app.add_option("input", input_, "Notebook file ('-' for stdin)")
        ->required()
        ->type_name("<file>");

    app.add_option("index", index_, "Position of the new cell (cell count appends)")
        ->required()
        ->type_name("<index>");

    app.add_option("-l,--lang", language_, "Wrap content for this language")
        ->type_name("<lang>");

    content_.add_options(app);

    app.add_flag("--in-place", in_place_, "Write the result back to the input file");
}

int InsertCommand::execute(CommandContext& ctx) {
    if (in_place_ && input_ == STDIN_PATH) {
        std::cerr << "Error: --in-place needs a notebook file\n";
        return NBSRC_EXIT_USER_ERROR;
    }

    auto language = resolve_language(language_);
    if (!language.ok()) {
        return report_error(language.error());
    }

    auto content = content_.resolve(input_);
    if (!content.ok()) {
        return report_error(content.error());
    }

    auto cells_result = load_notebook(ctx, input_);
    if (!cells_result.ok()) {
        return report_error(cells_result.error());
    }

    auto updated = insert_cell(cells_result.value(), index_, content.value(), language.value());
    if (!updated.ok()) {
        return report_error(updated.error());
    }

    ctx.logger->debug("Inserted cell at " + std::to_string(index_));
    return emit_notebook(ctx, updated.value(), input_, in_place_ ? input_ : "");
}

}  // namespace nbsrc::cli
