#pragma once
#include "chunkwire/cli/command.hpp"

namespace chunkwire::commands {

class IdsCommand : public chunkwire::cli::Command {
public:
    IdsCommand();
    int run(chunkwire::cli::CommandContext& ctx) override;
};

}  // namespace chunkwire::commands
