#pragma once
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace chunkwire::cli {

// Parsed flags of one command invocation plus its positional arguments.
class CommandContext {
public:
    CommandContext() = default;
    explicit CommandContext(boost::program_options::variables_map vm)
        : vm_(std::move(vm)) {}

    // Empty when the flag is unknown or has no value.
    std::string get_flag(const std::string& name) const;
    bool get_bool_flag(const std::string& name) const;
    int get_int_flag(const std::string& name) const;

    // True only when the flag appeared on the command line.
    bool is_user_provided(const std::string& name) const;

    void add_arg(const std::string& arg) { args_.push_back(arg); }
    const std::vector<std::string>& args() const { return args_; }

private:
    boost::program_options::variables_map vm_;
    std::vector<std::string> args_;
};

enum class FlagType { String, Bool, Int };

// A node in the command tree. A command with subcommands treats the first
// token it does not recognize as the subcommand name and hands it the rest of
// the line; a leaf command rejects unknown options.
class Command {
public:
    Command(std::string name, std::string description);
    virtual ~Command() = default;

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }

    void add_command(std::shared_ptr<Command> cmd);
    std::shared_ptr<Command> find_command(const std::string& name) const;

    // A short_name of '\0' registers the long form only.
    Command& add_string_flag(const std::string& name,
                             const std::string& description,
                             const std::string& default_value = "",
                             char short_name = '\0');
    Command& add_bool_flag(const std::string& name,
                           const std::string& description,
                           char short_name = '\0');
    Command& add_int_flag(const std::string& name,
                          const std::string& description, int default_value,
                          char short_name = '\0');

    Command& set_long_description(const std::string& text) {
        long_description_ = text;
        return *this;
    }
    Command& set_usage(const std::string& usage) {
        usage_ = usage;
        return *this;
    }
    Command& set_example(const std::string& example) {
        example_ = example;
        return *this;
    }

    // argv[0] names this command. Returns the exit status of the command that
    // ran; an exception is printed to stderr and becomes status 1.
    int execute(int argc, char* argv[]);

    void print_help(std::ostream& out = std::cout) const;

    virtual int run(CommandContext& ctx) = 0;

protected:
    // Runs with this command's own flags before a subcommand takes over.
    // A non-zero status is returned without dispatching.
    virtual int prepare(const CommandContext&) { return 0; }

private:
    struct Flag {
        std::string name;
        char short_name = '\0';
        std::string description;
        FlagType type = FlagType::String;
        std::string default_text;
        int default_number = 0;
    };

    boost::program_options::options_description options() const;
    int dispatch(int argc, char* argv[]);

    std::string name_;
    std::string description_;
    std::string long_description_;
    std::string usage_;
    std::string example_;
    std::vector<Flag> flags_;
    std::vector<std::shared_ptr<Command>> subcommands_;
};

}  // namespace chunkwire::cli
