#pragma once
#include <boost/log/trivial.hpp>

#include "sprout/log/log_config.hpp"

namespace sprout::log {

/**
 * @brief Sets up the Boost.Log core from a LogConfig
 *
 * Calling init() again replaces the previous sinks.
 */
class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static void set_level(LogLevel level);
    static LogLevel level();
};

}  // namespace sprout::log

#define SPROUT_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define SPROUT_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define SPROUT_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define SPROUT_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define SPROUT_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define SPROUT_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
