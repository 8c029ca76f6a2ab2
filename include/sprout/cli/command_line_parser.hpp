#pragma once
#include <optional>
#include <string>

namespace sprout::cli {

struct CommandLineOptions {
    bool show_version = false;
    bool show_help = false;
    bool parse_error = false;
    std::string config_file;
    // Override container.base_package
    std::optional<std::string> base_package;
    // Override log.level
    std::optional<std::string> log_level;
};

class CommandLineParser {
public:
    static CommandLineOptions parse(int argc, const char* const argv[]);
};

}  // namespace sprout::cli
