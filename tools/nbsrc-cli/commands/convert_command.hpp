#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace nbsrc::cli {

/**
 * Re-render a whole notebook, e.g. SOURCE to JSON or back.
 */
class ConvertCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "convert"; }
    std::string description() const override {
        return "Convert a notebook between SOURCE and JSON";
    }

private:
    std::string input_;
    std::string output_;
};

}  // namespace nbsrc::cli
