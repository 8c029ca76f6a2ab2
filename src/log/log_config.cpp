#include "sprout/log/log_config.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <stdexcept>
#include <utility>

namespace sprout::log {

namespace {

const std::pair<const char*, LogLevel> LEVEL_NAMES[] = {
    {"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG},
    {"info", LogLevel::INFO},   {"warn", LogLevel::WARN},
    {"warning", LogLevel::WARN}, {"error", LogLevel::ERROR},
    {"fatal", LogLevel::FATAL}, {"critical", LogLevel::FATAL},
};

void read_sink(const boost::property_tree::ptree& section, SinkConfig& sink) {
    sink.enabled = section.get("enabled", sink.enabled);
    sink.format = section.get("format", sink.format);
}

}  // namespace

LogLevel parse_level(const std::string& name) {
    for (const auto& [level_name, level] : LEVEL_NAMES) {
        if (boost::algorithm::iequals(name, level_name)) {
            return level;
        }
    }
    throw std::invalid_argument("Invalid log level: " + name);
}

const char* to_string(LogLevel level) {
    // First entry per level is its canonical name
    for (const auto& [level_name, value] : LEVEL_NAMES) {
        if (value == level) {
            return level_name;
        }
    }
    return "unknown";
}

void LogConfig::from_ptree(const boost::property_tree::ptree& section) {
    if (auto name = section.get_optional<std::string>("level")) {
        level = parse_level(*name);
    }
    if (auto console_section = section.get_child_optional("console")) {
        read_sink(*console_section, console);
    }
    if (auto file_section = section.get_child_optional("file")) {
        read_sink(*file_section, file);
        read(*file_section, "path", file.path);
        read(*file_section, "rotation_size", file.rotation_size);
        read(*file_section, "max_files", file.max_files);
    }
}

void LogConfig::validate() const {
    if (!file.enabled) {
        return;
    }
    if (file.path.empty()) {
        throw std::invalid_argument(
            "log.file.path is required when file logging is enabled");
    }
    if (file.rotation_size <= 0 || file.max_files <= 0) {
        throw std::invalid_argument(
            "log.file.rotation_size and log.file.max_files must be positive");
    }
}

}  // namespace sprout::log
