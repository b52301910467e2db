#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <cstdint>

namespace nbsrc::cli {

/**
 * Print one cell by index.
 */
class GetCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "get"; }
    std::string description() const override {
        return "Print a cell by index";
    }

private:
    std::string input_;
    int64_t index_ = 0;
    bool raw_ = false;
    bool unwrap_ = false;
};

}  // namespace nbsrc::cli
