#include "chunkwire/commands/encode_command.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iostream>
#include <stdexcept>

#include "chunkwire/log/logger.hpp"
#include "chunkwire/protocol/value_yaml.hpp"

namespace chunkwire::commands {

EncodeCommand::EncodeCommand()
    : chunkwire::cli::Command("encode", "Encode a YAML document as chunks") {
    set_long_description(
        "Reads a YAML document and writes it as a chunk stream. A root map "
        "is written in ascending tag order, a root sequence of one-entry "
        "maps in document order. Map keys are 4-character tags; '!!binary' "
        "scalars are raw bytes, integers are written in decimal, everything "
        "else is UTF-8 text.")
        .set_usage("chunkwire encode [-i FILE] [-o FILE]")
        .set_example(
            "  echo '{DLAY: {NTVL: 5}}' | chunkwire encode > delay.bin\n"
            "  chunkwire encode -i compute.yaml -o compute.bin");

    add_string_flag("input", "YAML input file, '-' for stdin", "-", 'i');
    add_string_flag("output", "Output file, '-' for stdout", "-", 'o');
}

int EncodeCommand::run(chunkwire::cli::CommandContext& ctx) {
    const std::string input = ctx.get_flag("input");
    const std::string output = ctx.get_flag("output");

    YAML::Node document =
        input == "-" ? YAML::Load(std::cin) : YAML::LoadFile(input);
    protocol::Bytes stream = protocol::stream_from_yaml(document);

    if (output == "-") {
        std::cout.write(reinterpret_cast<const char*>(stream.data()),
                        static_cast<std::streamsize>(stream.size()));
        std::cout.flush();
    } else {
        std::ofstream ofs(output, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw std::runtime_error("Cannot open output file: " + output);
        }
        ofs.write(reinterpret_cast<const char*>(stream.data()),
                  static_cast<std::streamsize>(stream.size()));
        if (!ofs) {
            throw std::runtime_error("Failed to write output file: " + output);
        }
    }

    CHUNKWIRE_LOG_INFO << "Encoded " << stream.size() << " bytes from "
                       << (input == "-" ? "stdin" : input);
    return 0;
}

}  // namespace chunkwire::commands
