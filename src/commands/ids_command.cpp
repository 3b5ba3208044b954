#include "chunkwire/commands/ids_command.hpp"

#include <iomanip>
#include <iostream>

#include "chunkwire/protocol/chunk_dumper.hpp"
#include "chunkwire/protocol/message_ids.hpp"

namespace chunkwire::commands {

IdsCommand::IdsCommand()
    : chunkwire::cli::Command("ids", "List the known message IDs") {
    set_usage("chunkwire ids");
}

int IdsCommand::run(chunkwire::cli::CommandContext&) {
    std::cout << "socket: " << protocol::kSocketName << std::endl;
    for (const auto& id : protocol::message_ids()) {
        std::cout << "  '" << protocol::ChunkDumper::format_tag(id.tag) << "'  "
                  << std::left << std::setw(18) << id.name << id.description
                  << std::endl;
    }
    return 0;
}

}  // namespace chunkwire::commands
