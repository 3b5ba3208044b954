#include "chunkwire/cli/root_command.hpp"

#include <iostream>

#include "chunkwire/commands/dump_command.hpp"
#include "chunkwire/commands/encode_command.hpp"
#include "chunkwire/commands/ids_command.hpp"
#include "chunkwire/config/config.hpp"
#include "chunkwire/log/logger.hpp"
#include "chunkwire/protocol/dump_config.hpp"
#include "chunkwire/version.hpp"

namespace chunkwire::cli {

RootCommand::RootCommand()
    : Command("chunkwire", "Tagged binary chunk encoder and inspector") {
    set_long_description(
        "Builds chunk streams (4-byte tag, little-endian uint32 length, "
        "payload) from YAML documents and prints existing streams as a "
        "tree.")
        .set_usage("chunkwire [GLOBAL_OPTIONS] <COMMAND> [COMMAND_OPTIONS]")
        .set_example(
            "  chunkwire encode -i request.yaml -o request.bin\n"
            "  chunkwire dump -i request.bin --nested DLAY,CMPU\n"
            "  chunkwire --config chunkwire.yaml dump -i capture.bin");

    add_string_flag("config", "Configuration file (YAML, JSON or INI)", "", 'c');
    add_string_flag("log-level",
                    "Log level: trace, debug, info, warn, error, fatal");
    add_bool_flag("version", "Show version information", 'v');

    register_commands();
}

std::shared_ptr<RootCommand> RootCommand::create() {
    struct MakeSharedEnabler : public RootCommand {};
    return std::make_shared<MakeSharedEnabler>();
}

void RootCommand::register_commands() {
    add_command(std::make_shared<chunkwire::commands::EncodeCommand>());
    add_command(std::make_shared<chunkwire::commands::DumpCommand>());
    add_command(std::make_shared<chunkwire::commands::IdsCommand>());
}

int RootCommand::prepare(const CommandContext& ctx) {
    auto& manager = config::ConfigManager::instance();
    auto log_config = manager.get_configuration_properties<log::LogConfig>();
    if (!log_config) {
        log_config =
            config::ConfigurationPropertiesFactory<log::LogConfig>::
                create_and_register();
    }
    if (!manager.get_configuration_properties<protocol::DumpConfig>()) {
        config::ConfigurationPropertiesFactory<
            protocol::DumpConfig>::create_and_register();
    }

    log::Logger::init(*log_config);

    const std::string config_file = ctx.get_flag("config");
    if (!config_file.empty()) {
        manager.load_config(config_file, config::format_from_path(config_file));
        log::Logger::init(*log_config);
    }

    const std::string level = ctx.get_flag("log-level");
    if (!level.empty()) {
        log::Logger::set_level(log::LogConfig::level_from_string(level));
    }
    return 0;
}

int RootCommand::run(CommandContext& ctx) {
    if (ctx.get_bool_flag("version")) {
        chunkwire::print_version();
        return 0;
    }

    print_help();
    return 0;
}

std::shared_ptr<RootCommand> CommandRegistry::create_root_command() {
    return RootCommand::create();
}

}  // namespace chunkwire::cli
