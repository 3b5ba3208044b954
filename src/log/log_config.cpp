#include "chunkwire/log/log_config.hpp"

#include <algorithm>
#include <array>
#include <boost/algorithm/string/case_conv.hpp>
#include <stdexcept>
#include <utility>

namespace chunkwire::log {

namespace {

using Level = LogConfig::LogLevel;

// First spelling of each level is the canonical one.
constexpr std::array<std::pair<const char*, Level>, 8> kLevelNames{{
    {"trace", Level::TRACE},
    {"debug", Level::DEBUG},
    {"info", Level::INFO},
    {"warn", Level::WARN},
    {"warning", Level::WARN},
    {"error", Level::ERROR},
    {"fatal", Level::FATAL},
    {"critical", Level::FATAL},
}};

}  // namespace

void LogConfig::from_ptree(const boost::property_tree::ptree& pt) {
    if (auto level = optional_value<std::string>(pt, "global_level")) {
        global_level = level_from_string(*level);
    }

    console.enabled = value_or(pt, "console.enabled", console.enabled);
    console.pattern = value_or(pt, "console.pattern", console.pattern);

    file.enabled = value_or(pt, "file.enabled", file.enabled);
    file.log_file = value_or(pt, "file.log_file", file.log_file);
    file.max_file_size =
        value_or(pt, "file.max_file_size", file.max_file_size);
    file.max_files = value_or(pt, "file.max_files", file.max_files);
    file.pattern = value_or(pt, "file.pattern", file.pattern);
}

void LogConfig::validate() const {
    if (!file.enabled) {
        return;
    }
    if (file.log_file.empty()) {
        throw std::invalid_argument("log.file.log_file is required when "
                                    "log.file.enabled is true");
    }
    if (file.max_file_size <= 0 || file.max_files <= 0) {
        throw std::invalid_argument(
            "log.file.max_file_size and log.file.max_files must be positive");
    }
}

LogConfig::LogLevel LogConfig::level_from_string(const std::string& name) {
    const std::string lowered = boost::algorithm::to_lower_copy(name);
    auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                           [&lowered](const auto& entry) {
                               return lowered == entry.first;
                           });
    if (it == kLevelNames.end()) {
        throw std::invalid_argument("Invalid log level: " + name);
    }
    return it->second;
}

std::string LogConfig::level_to_string(LogLevel level) {
    auto it = std::find_if(
        kLevelNames.begin(), kLevelNames.end(),
        [level](const auto& entry) { return entry.second == level; });
    return it != kLevelNames.end() ? it->first : "unknown";
}

}  // namespace chunkwire::log
