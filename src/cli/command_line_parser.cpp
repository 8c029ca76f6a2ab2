#include "sprout/cli/command_line_parser.hpp"

#include <boost/program_options.hpp>
#include <iostream>

#include "sprout/config/config.hpp"
#include "sprout/version.hpp"

namespace po = boost::program_options;

namespace sprout::cli {

CommandLineOptions CommandLineParser::parse(int argc,
                                            const char* const argv[]) {
    CommandLineOptions options;
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Print help information")
        ("version,v", "Print version information")
        ("config,c",
         po::value<std::string>()->default_value(
             config::DEFAULT_CONFIG_FILE),
         "Specify configuration file")
        ("package,p", po::value<std::string>(),
         "Base package to scan for components")
        ("log-level,l", po::value<std::string>(),
         "Log level (trace, debug, info, warn, error, fatal)");

    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            options.show_help = true;
            std::cout << desc << std::endl;
        }

        if (vm.count("version")) {
            options.show_version = true;
            std::cout << "Sprout IoC container v" << sprout::VERSION
                      << std::endl;
        }

        options.config_file = vm["config"].as<std::string>();
        if (vm.count("package")) {
            options.base_package = vm["package"].as<std::string>();
        }
        if (vm.count("log-level")) {
            options.log_level = vm["log-level"].as<std::string>();
        }
    } catch (const po::error& e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        options.parse_error = true;
        options.show_help = true;
    }

    return options;
}

}  // namespace sprout::cli
