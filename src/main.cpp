#include <filesystem>
#include <iostream>

#include "shapes.hpp"
#include "sprout/annotations/component_registry.hpp"
#include "sprout/cli/command_line_parser.hpp"
#include "sprout/config/config.hpp"
#include "sprout/core/application_context.hpp"
#include "sprout/di/container_config.hpp"
#include "sprout/log/logger.hpp"

namespace {

int run(const sprout::cli::CommandLineOptions& options) {
    using namespace sprout;

    auto& manager = config::ConfigManager::instance();
    auto log_config = manager.bind<log::LogConfig>();
    auto container_config = manager.bind<di::ContainerConfig>();

    const bool config_found = std::filesystem::exists(options.config_file);
    if (config_found) {
        manager.load_config(options.config_file);
    } else if (options.config_file != config::DEFAULT_CONFIG_FILE) {
        std::cerr << "Configuration file not found: " << options.config_file
                  << std::endl;
        return 1;
    }

    // Command line wins over the file
    if (options.log_level) {
        manager.set_property("log.level", *options.log_level);
    }
    if (options.base_package) {
        manager.set_property("container.base_package", *options.base_package);
    }
    log::Logger::init(*log_config);
    if (!config_found) {
        SPROUT_LOG_WARN << "No configuration at " << options.config_file
                        << ", using defaults";
    }

    core::ApplicationContext context(
        std::make_shared<annotations::ComponentScanner>(
            container_config->base_package),
        nullptr, container_config->factory_options());
    context.refresh();

    for (const auto& definition : context.definitions()) {
        std::cout << definition.bean_type().name() << " ["
                  << definition.registry_qualifier() << "] "
                  << (definition.is_singleton() ? "singleton" : "prototype")
                  << std::endl;
    }

    if (context.contains_bean<examples::shapes::ShapePrinter>()) {
        std::cout << context.get_bean<examples::shapes::ShapePrinter>()->print();
    }

    log::Logger::shutdown();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options = sprout::cli::CommandLineParser::parse(argc, argv);
    if (options.parse_error) {
        return 1;
    }
    if (options.show_help || options.show_version) {
        return 0;
    }

    try {
        return run(options);
    } catch (const sprout::di::ContainerException& e) {
        SPROUT_LOG_FATAL << "Container error ("
                         << sprout::di::to_string(e.code())
                         << "): " << e.what();
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
