#pragma once
#include <memory>

#include "chunkwire/cli/command.hpp"

namespace chunkwire::cli {

// Top-level "chunkwire" command. Its global flags set up logging and load the
// optional configuration file before any subcommand runs.
class RootCommand : public Command {
public:
    static std::shared_ptr<RootCommand> create();

    int run(CommandContext& ctx) override;

protected:
    RootCommand();
    int prepare(const CommandContext& ctx) override;

private:
    void register_commands();
};

class CommandRegistry {
public:
    static std::shared_ptr<RootCommand> create_root_command();
};

}  // namespace chunkwire::cli
