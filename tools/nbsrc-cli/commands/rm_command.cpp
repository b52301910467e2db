#include "rm_command.hpp"

namespace nbsrc::cli {

void RmCommand::setup(CLI::App& app) {
    app.add_option("input", input_, "Notebook file ('-' for stdin)")
        ->required()
        ->type_name("<file>");

    app.add_option("index", index_, "Cell index")
        ->required()
        ->type_name("<index>");

    app.add_flag("--in-place", in_place_, "Write the result back to the input file");
}

int RmCommand::execute(CommandContext& ctx) {
    if (in_place_ && input_ == STDIN_PATH) {
        std::cerr << "Error: --in-place needs a notebook file\n";
        return NBSRC_EXIT_USER_ERROR;
    }

    auto cells_result = load_notebook(ctx, input_);
    if (!cells_result.ok()) {
        return report_error(cells_result.error());
    }

    auto updated = delete_cell(cells_result.value(), index_);
    if (!updated.ok()) {
        return report_error(updated.error());
    }

    ctx.logger->debug("Removed cell " + std::to_string(index_));
    return emit_notebook(ctx, updated.value(), input_, in_place_ ? input_ : "");
}

}  // namespace nbsrc::cli
