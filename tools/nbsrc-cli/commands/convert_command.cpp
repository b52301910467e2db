#include "convert_command.hpp"

namespace nbsrc::cli {

void ConvertCommand::setup(CLI::App& app) {
    app.add_option("input", input_, "Notebook file ('-' for stdin)")
        ->required()
        ->type_name("<file>");

    app.add_option("-o,--output", output_, "Write to file instead of stdout")
        ->type_name("<file>");
}

int ConvertCommand::execute(CommandContext& ctx) {
    auto cells_result = load_notebook(ctx, input_);
    if (!cells_result.ok()) {
        return report_error(cells_result.error());
    }

    return emit_notebook(ctx, cells_result.value(), input_, output_);
}

}  // namespace nbsrc::cli
