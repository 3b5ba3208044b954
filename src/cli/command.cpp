#include "chunkwire/cli/command.hpp"

#include <algorithm>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <iomanip>
#include <stdexcept>

namespace po = boost::program_options;

namespace chunkwire::cli {

std::string CommandContext::get_flag(const std::string& name) const {
    auto it = vm_.find(name);
    if (it == vm_.end() || it->second.empty()) {
        return "";
    }
    return it->second.as<std::string>();
}

bool CommandContext::get_bool_flag(const std::string& name) const {
    auto it = vm_.find(name);
    return it != vm_.end() && it->second.as<bool>();
}

int CommandContext::get_int_flag(const std::string& name) const {
    auto it = vm_.find(name);
    return it != vm_.end() ? it->second.as<int>() : 0;
}

bool CommandContext::is_user_provided(const std::string& name) const {
    auto it = vm_.find(name);
    return it != vm_.end() && !it->second.defaulted();
}

Command::Command(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Command::add_command(std::shared_ptr<Command> cmd) {
    subcommands_.push_back(std::move(cmd));
}

std::shared_ptr<Command> Command::find_command(const std::string& name) const {
    auto it = std::find_if(
        subcommands_.begin(), subcommands_.end(),
        [&name](const auto& cmd) { return cmd->name() == name; });
    return it != subcommands_.end() ? *it : nullptr;
}

Command& Command::add_string_flag(const std::string& name,
                                  const std::string& description,
                                  const std::string& default_value,
                                  char short_name) {
    flags_.push_back(
        {name, short_name, description, FlagType::String, default_value, 0});
    return *this;
}

Command& Command::add_bool_flag(const std::string& name,
                                const std::string& description,
                                char short_name) {
    flags_.push_back({name, short_name, description, FlagType::Bool, "", 0});
    return *this;
}

Command& Command::add_int_flag(const std::string& name,
                               const std::string& description,
                               int default_value, char short_name) {
    flags_.push_back(
        {name, short_name, description, FlagType::Int, "", default_value});
    return *this;
}

po::options_description Command::options() const {
    po::options_description desc("Flags");
    desc.add_options()("help,h", "Show this help");

    for (const auto& flag : flags_) {
        std::string spec = flag.name;
        if (flag.short_name != '\0') {
            spec += ',';
            spec += flag.short_name;
        }
        switch (flag.type) {
            case FlagType::Bool:
                desc.add_options()(spec.c_str(), po::bool_switch(),
                                   flag.description.c_str());
                break;
            case FlagType::Int:
                desc.add_options()(
                    spec.c_str(),
                    po::value<int>()->default_value(flag.default_number),
                    flag.description.c_str());
                break;
            case FlagType::String:
                desc.add_options()(
                    spec.c_str(),
                    po::value<std::string>()->default_value(flag.default_text),
                    flag.description.c_str());
                break;
        }
    }
    return desc;
}

int Command::execute(int argc, char* argv[]) {
    try {
        return dispatch(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int Command::dispatch(int argc, char* argv[]) {
    const po::options_description visible = options();
    po::variables_map vm;
    std::vector<std::string> rest;

    if (subcommands_.empty()) {
        po::options_description all;
        all.add(visible).add_options()(
            "args", po::value<std::vector<std::string>>());
        po::positional_options_description positional;
        positional.add("args", -1);
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        if (vm.count("args")) {
            rest = vm["args"].as<std::vector<std::string>>();
        }
    } else {
        // Options of the subcommand pass through untouched.
        po::parsed_options parsed = po::command_line_parser(argc, argv)
                                        .options(visible)
                                        .allow_unregistered()
                                        .run();
        po::store(parsed, vm);
        rest = po::collect_unrecognized(parsed.options, po::include_positional);
    }
    po::notify(vm);

    const bool help = vm.count("help") > 0;
    CommandContext ctx(std::move(vm));

    if (!subcommands_.empty() && !rest.empty()) {
        auto sub = find_command(rest.front());
        if (!sub) {
            throw std::runtime_error("Unknown command '" + rest.front() +
                                     "' for '" + name_ + "'");
        }
        if (int status = prepare(ctx); status != 0) {
            return status;
        }
        if (help) {
            rest.emplace_back("--help");
        }
        std::vector<char*> sub_argv;
        for (auto& arg : rest) {
            sub_argv.push_back(arg.data());
        }
        return sub->dispatch(static_cast<int>(sub_argv.size()),
                             sub_argv.data());
    }

    if (help) {
        print_help();
        return 0;
    }
    for (const auto& arg : rest) {
        ctx.add_arg(arg);
    }
    return run(ctx);
}

void Command::print_help(std::ostream& out) const {
    out << name_ << " - " << description_ << "\n\n";
    if (!long_description_.empty()) {
        out << long_description_ << "\n\n";
    }
    out << "Usage: "
        << (usage_.empty() ? name_ + " [OPTIONS]" : usage_) << "\n\n";

    if (!subcommands_.empty()) {
        out << "Commands:\n";
        for (const auto& cmd : subcommands_) {
            out << "  " << std::left << std::setw(10) << cmd->name()
                << cmd->description() << '\n';
        }
        out << '\n';
    }

    out << options() << '\n';

    if (!example_.empty()) {
        out << "Examples:\n" << example_ << "\n\n";
    }
    if (!subcommands_.empty()) {
        out << "Run '" << name_
            << " <command> --help' for the flags of a command." << std::endl;
    }
}

}  // namespace chunkwire::cli
