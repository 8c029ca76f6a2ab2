#include "sprout/di/container_config.hpp"

#include <stdexcept>

namespace sprout::di {

void ContainerConfig::from_ptree(const boost::property_tree::ptree& section) {
    read(section, "base_package", base_package);
    read(section, "strict_setter_injection", strict_setter_injection);
}

void ContainerConfig::validate() const {
    if (base_package.find('.') != std::string::npos ||
        base_package.find('/') != std::string::npos) {
        throw std::invalid_argument(
            "container.base_package must use '::' as separator: " +
            base_package);
    }
    if (base_package.size() >= 2 &&
        (base_package.compare(0, 2, "::") == 0 ||
         base_package.compare(base_package.size() - 2, 2, "::") == 0)) {
        throw std::invalid_argument(
            "container.base_package must not start or end with '::': " +
            base_package);
    }
}

BeanFactoryOptions ContainerConfig::factory_options() const {
    BeanFactoryOptions options;
    options.strict_setter_injection = strict_setter_injection;
    return options;
}

}  // namespace sprout::di
