#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <cstdint>

namespace nbsrc::cli {

/**
 * Delete one cell; later cells move down by one.
 */
class RmCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "rm"; }
    std::string description() const override {
        return "Delete a cell by index";
    }

private:
    std::string input_;
    int64_t index_ = 0;
    bool in_place_ = false;
};

}  // namespace nbsrc::cli
