#pragma once

#include "command.hpp"
#include "content_source.hpp"
#include "exit_codes.hpp"

#include <cstdint>

namespace nbsrc::cli {

/**
 * Insert a new cell before an index and write the notebook back out.
 *
 * With -l/--lang the content is magic-wrapped for that language.
 * The result goes to stdout unless --in-place is given.
 */
class InsertCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "insert"; }
    std::string description() const override {
        return "Insert a new cell";
    }

private:
    std::string input_;
    int64_t index_ = 0;
    std::string language_;
    ContentSource content_;
    bool in_place_ = false;
};

}  // namespace nbsrc::cli
