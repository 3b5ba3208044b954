#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "chunkwire/log/log_config.hpp"

namespace chunkwire::log {

class Logger {
public:
    static void init(const LogConfig& config);
    static void shutdown();
    static void set_level(LogConfig::LogLevel level);

private:
    static LogConfig config_;
};

}  // namespace chunkwire::log

#define CHUNKWIRE_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define CHUNKWIRE_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define CHUNKWIRE_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define CHUNKWIRE_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define CHUNKWIRE_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define CHUNKWIRE_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
