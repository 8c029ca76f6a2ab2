#include "sprout/log/logger.hpp"

#include <atomic>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <filesystem>
#include <iostream>

namespace logging = boost::log;
namespace keywords = boost::log::keywords;
using boost::log::trivial::severity_level;

namespace sprout::log {

namespace {

std::atomic<LogLevel> current_level{LogLevel::INFO};

// LogLevel mirrors the trivial severity order
severity_level to_severity(LogLevel level) {
    return static_cast<severity_level>(static_cast<int>(level));
}

void install_filter(LogLevel level) {
    current_level = level;
    logging::core::get()->set_filter(
        logging::expressions::attr<severity_level>("Severity") >=
        to_severity(level));
}

void add_file_sink(const FileSinkConfig& file) {
    auto directory = std::filesystem::path(file.path).parent_path();
    if (!directory.empty()) {
        std::filesystem::create_directories(directory);
    }
    logging::add_file_log(
        keywords::file_name = file.path,
        keywords::rotation_size = file.rotation_size,
        keywords::time_based_rotation =
            logging::sinks::file::rotation_at_time_point(0, 0, 0),
        keywords::max_files = file.max_files,
        keywords::auto_flush = true,
        keywords::format = logging::parse_formatter(file.format));
}

}  // namespace

void Logger::init(const LogConfig& config) {
    auto core = logging::core::get();
    core->remove_all_sinks();
    logging::register_simple_formatter_factory<severity_level, char>(
        "Severity");

    if (config.file.enabled) {
        add_file_sink(config.file);
    }
    if (config.console.enabled) {
        logging::add_console_log(
            std::clog,
            keywords::format = logging::parse_formatter(config.console.format));
    }

    logging::add_common_attributes();
    install_filter(config.level);

    SPROUT_LOG_DEBUG << "Logger initialized, level " << to_string(config.level);
}

void Logger::shutdown() {
    auto core = logging::core::get();
    core->flush();
    core->remove_all_sinks();
}

void Logger::set_level(LogLevel level) {
    install_filter(level);
    SPROUT_LOG_DEBUG << "Log level set to " << to_string(level);
}

LogLevel Logger::level() { return current_level; }

}  // namespace sprout::log
