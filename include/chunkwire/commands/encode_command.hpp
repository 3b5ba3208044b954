#pragma once
#include "chunkwire/cli/command.hpp"

namespace chunkwire::commands {

class EncodeCommand : public chunkwire::cli::Command {
public:
    EncodeCommand();
    int run(chunkwire::cli::CommandContext& ctx) override;
};

}  // namespace chunkwire::commands
