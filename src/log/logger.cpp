#include "chunkwire/log/logger.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <filesystem>
#include <iostream>

namespace logging = boost::log;
namespace keywords = boost::log::keywords;

namespace chunkwire::log {

LogConfig Logger::config_;

namespace {

static_assert(static_cast<int>(LogConfig::LogLevel::TRACE) ==
                  logging::trivial::trace &&
              static_cast<int>(LogConfig::LogLevel::FATAL) ==
                  logging::trivial::fatal);

logging::trivial::severity_level severity_of(LogConfig::LogLevel level) {
    return static_cast<logging::trivial::severity_level>(level);
}

void add_file_sink(const LogConfig::FileConfig& file) {
    const auto directory = std::filesystem::path(file.log_file).parent_path();
    if (!directory.empty()) {
        std::filesystem::create_directories(directory);
    }
    logging::add_file_log(keywords::file_name = file.log_file,
                          keywords::rotation_size = file.max_file_size,
                          keywords::max_files = file.max_files,
                          keywords::auto_flush = true,
                          keywords::format =
                              logging::parse_formatter(file.pattern));
}

void add_console_sink(const LogConfig::ConsoleConfig& console) {
    logging::add_console_log(
        std::clog, keywords::format = logging::parse_formatter(console.pattern));
}

}  // namespace

void Logger::init(const LogConfig& config) {
    config_ = config;

    auto core = logging::core::get();
    core->remove_all_sinks();
    if (config_.file.enabled) {
        add_file_sink(config_.file);
    }
    if (config_.console.enabled) {
        add_console_sink(config_.console);
    }
    logging::add_common_attributes();
    set_level(config_.global_level);

    CHUNKWIRE_LOG_DEBUG << "Logging at level "
                        << LogConfig::level_to_string(config_.global_level);
}

void Logger::shutdown() {
    auto core = logging::core::get();
    core->flush();
    core->remove_all_sinks();
}

void Logger::set_level(LogConfig::LogLevel level) {
    config_.global_level = level;
    logging::core::get()->set_filter(logging::trivial::severity >=
                                     severity_of(level));
}

}  // namespace chunkwire::log
