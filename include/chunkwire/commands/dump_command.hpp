#pragma once
#include "chunkwire/cli/command.hpp"

namespace chunkwire::commands {

class DumpCommand : public chunkwire::cli::Command {
public:
    DumpCommand();
    int run(chunkwire::cli::CommandContext& ctx) override;
};

}  // namespace chunkwire::commands
