#include "list_command.hpp"
#include <algorithm>
#include <iomanip>

namespace nbsrc::cli {

void ListCommand::setup(CLI::App& app) {
    app.add_option("input", input_, "Notebook file ('-' for stdin)")
        ->required()
        ->type_name("<file>");
}

int ListCommand::execute(CommandContext& ctx) {
    auto cells_result = load_notebook(ctx, input_);
    if (!cells_result.ok()) {
        return report_error(cells_result.error());
    }

    auto& cells = cells_result.value();

    std::cout << std::left
              << std::setw(7) << "INDEX"
              << std::setw(10) << "LANG"
              << std::setw(8) << "LINES"
              << "FIRST LINE\n";
    std::cout << std::string(80, '-') << "\n";

    for (const auto& cell : cells) {
        std::string first_line = cell.content.substr(0, cell.content.find('\n'));
        size_t line_count = cell.content.empty()
            ? 0
            : static_cast<size_t>(std::count(cell.content.begin(), cell.content.end(), '\n')) + 1;
        const char* lang = cell.language.has_value() ? language_name(*cell.language) : "default";

        std::cout << std::left
                  << std::setw(7) << cell.index
                  << std::setw(10) << lang
                  << std::setw(8) << line_count
                  << truncate(first_line, 55) << "\n";
    }

    std::cout << "\n" << cells.size() << " cell(s)\n";
    return NBSRC_EXIT_SUCCESS;
}

}  // namespace nbsrc::cli
