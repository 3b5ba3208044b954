#include "chunkwire/commands/dump_command.hpp"

#include <array>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "chunkwire/config/config.hpp"
#include "chunkwire/log/logger.hpp"
#include "chunkwire/protocol/chunk_assembler.hpp"
#include "chunkwire/protocol/chunk_dumper.hpp"

namespace chunkwire::commands {

namespace {
constexpr std::size_t kReadBlockSize = 4096;
}  // namespace

DumpCommand::DumpCommand()
    : chunkwire::cli::Command("dump", "Print a chunk stream as a tree") {
    set_long_description(
        "Reads a chunk stream and prints one line per chunk with its tag, "
        "payload length and a preview of the payload. Payloads of nested "
        "tags are decoded again as chunks. Bytes left over at the end that "
        "do not form a complete chunk are reported, not treated as an "
        "error.")
        .set_usage("chunkwire dump [-i FILE] [--nested TAGS] [--depth N]")
        .set_example(
            "  chunkwire dump -i request.bin\n"
            "  chunkwire dump -i reply.bin --nested ANSR --no-names");

    add_string_flag("input", "Chunk stream file, '-' for stdin", "-", 'i');
    add_string_flag("nested", "Comma-separated tags whose payloads are chunks");
    add_int_flag("depth", "Maximum nesting depth to decode", -1);
    add_int_flag("preview", "Payload preview bytes, 0 for unlimited", -1);
    add_bool_flag("no-names", "Do not label known message IDs");
}

int DumpCommand::run(chunkwire::cli::CommandContext& ctx) {
    protocol::DumpConfig dump_config;
    if (auto configured = config::ConfigManager::instance()
                              .get_configuration_properties<
                                  protocol::DumpConfig>()) {
        dump_config = *configured;
    }
    if (ctx.is_user_provided("nested")) {
        dump_config.nested_tags =
            protocol::DumpConfig::split_tag_list(ctx.get_flag("nested"));
    }
    if (ctx.is_user_provided("depth")) {
        dump_config.max_depth = ctx.get_int_flag("depth");
    }
    if (ctx.is_user_provided("preview")) {
        int preview = ctx.get_int_flag("preview");
        if (preview < 0) {
            throw std::invalid_argument("--preview must not be negative");
        }
        dump_config.max_payload_preview = static_cast<std::size_t>(preview);
    }
    if (ctx.get_bool_flag("no-names")) {
        dump_config.show_names = false;
    }
    dump_config.validate();

    const std::string input = ctx.get_flag("input");
    std::ifstream file;
    std::istream* in = &std::cin;
    if (input != "-") {
        file.open(input, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Cannot open input file: " + input);
        }
        in = &file;
    }

    protocol::ChunkDumper dumper(dump_config);
    protocol::ChunkAssembler assembler;
    std::array<char, kReadBlockSize> block;
    std::size_t chunk_count = 0;

    while (*in) {
        in->read(block.data(), static_cast<std::streamsize>(block.size()));
        const auto received = static_cast<std::size_t>(in->gcount());
        if (received == 0) {
            break;
        }
        assembler.append(protocol::ByteSpan(
            reinterpret_cast<const std::uint8_t*>(block.data()), received));
        while (auto chunk = assembler.pop()) {
            dumper.dump_chunk(chunk->tag, chunk->payload, std::cout);
            ++chunk_count;
        }
    }
    if (in->bad()) {
        throw std::runtime_error("Failed to read input: " + input);
    }

    if (!assembler.empty()) {
        CHUNKWIRE_LOG_WARN << "Ignoring " << assembler.buffered_size()
                           << " trailing bytes that do not form a chunk";
        protocol::ChunkDumper::dump_trailing(assembler.buffered_size(),
                                             std::cout);
    }

    CHUNKWIRE_LOG_INFO << "Dumped " << chunk_count << " chunks from "
                       << (input == "-" ? "stdin" : input);
    return 0;
}

}  // namespace chunkwire::commands
