#pragma once

#include <cstdint>
#include <string>

#include "chunkwire/config/config.hpp"

namespace chunkwire::log {

// The "log" configuration section.
class LogConfig
    : public config::ClonableConfigurationProperties<LogConfig> {
public:
    // Same order as boost::log::trivial::severity_level.
    enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

    // Console output goes to stderr so encoded data on stdout stays clean.
    struct ConsoleConfig {
        bool enabled = true;
        std::string pattern = "[%TimeStamp%] [%Severity%] %Message%";
    };

    // Rotating file log, off unless configured.
    struct FileConfig {
        bool enabled = false;
        std::string log_file = "logs/chunkwire.log";
        std::int64_t max_file_size = 10 * 1024 * 1024;
        int max_files = 5;
        std::string pattern =
            "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%";
    };

    LogLevel global_level = LogLevel::WARN;
    ConsoleConfig console;
    FileConfig file;

    std::string properties_name() const override { return "log"; }
    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;

    // Case-insensitive; "warning" and "critical" are accepted as aliases.
    // Throws std::invalid_argument for anything else.
    static LogLevel level_from_string(const std::string& name);
    static std::string level_to_string(LogLevel level);
};

}  // namespace chunkwire::log
