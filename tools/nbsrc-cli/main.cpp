#include "commands/command.hpp"
#include "commands/convert_command.hpp"
#include "commands/get_command.hpp"
#include "commands/insert_command.hpp"
#include "commands/list_command.hpp"
#include "commands/rm_command.hpp"
#include "commands/update_command.hpp"

#include <exception>
#include <memory>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace nbsrc::cli;

    CLI::App app{"nbsrc - inspect and edit notebook SOURCE files"};
    app.require_subcommand(1);

    CommandContext ctx;
    bool no_header = false;

    app.add_flag("-v,--verbose", ctx.config.verbose, "Print debug output to stderr");
    app.add_flag("--no-header", no_header, "Omit the notebook header line from SOURCE output");
    app.add_option("--input-format", ctx.input_format,
                   "Input format (default: json for *.json files, else source)")
        ->check(CLI::IsMember({"source", "json"}));
    app.add_option("--output-format", ctx.output_format,
                   "Output format (default: the input's format when writing in place, else source)")
        ->check(CLI::IsMember({"source", "json"}));

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<ListCommand>());
    commands.push_back(std::make_unique<ConvertCommand>());
    commands.push_back(std::make_unique<GetCommand>());
    commands.push_back(std::make_unique<UpdateCommand>());
    commands.push_back(std::make_unique<InsertCommand>());
    commands.push_back(std::make_unique<RmCommand>());

    std::vector<CLI::App*> subcommands;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        subcommands.push_back(sub);
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    ctx.config.include_header = !no_header;

    nbsrc::ConsoleLogger logger;
    logger.set_min_level(ctx.config.verbose ? nbsrc::LogLevel::DEBUG : nbsrc::LogLevel::INFO);
    ctx.logger = &logger;

    for (size_t i = 0; i < commands.size(); ++i) {
        if (subcommands[i]->parsed()) {
            try {
                return commands[i]->execute(ctx);
            } catch (const std::exception& e) {
                logger.error(std::string("Unexpected failure in ") + commands[i]->name() +
                             ": " + e.what());
                return NBSRC_EXIT_INTERNAL;
            }
        }
    }

    return NBSRC_EXIT_USER_ERROR;
}
