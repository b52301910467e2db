#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace nbsrc::cli {

/**
 * List the cells of a notebook.
 */
class ListCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "list"; }
    std::string description() const override {
        return "List the cells of a notebook";
    }

private:
    std::string input_;
};

}  // namespace nbsrc::cli
