#pragma once

#include <cstdint>
#include <string>

#include "sprout/config/config.hpp"

namespace sprout::log {

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Parse a level name, case-insensitive
 *
 * Accepts "warning" for WARN and "critical" for FATAL.
 * @throws std::invalid_argument for an unknown name
 */
LogLevel parse_level(const std::string& name);
const char* to_string(LogLevel level);

inline constexpr const char* DEFAULT_LOG_FORMAT =
    "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%";

struct SinkConfig {
    bool enabled = true;
    std::string format = DEFAULT_LOG_FORMAT;
};

struct FileSinkConfig : SinkConfig {
    FileSinkConfig() { enabled = false; }

    std::string path = "logs/sprout.log";
    std::int64_t rotation_size = 10 * 1024 * 1024;
    int max_files = 5;
};

// The "log" section
class LogConfig : public config::ConfigurationProperties {
public:
    LogLevel level = LogLevel::INFO;
    SinkConfig console;
    FileSinkConfig file;

    std::string properties_name() const override { return "log"; }
    void from_ptree(const boost::property_tree::ptree& section) override;
    void validate() const override;
};

}  // namespace sprout::log
