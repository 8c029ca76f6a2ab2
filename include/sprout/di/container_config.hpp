#pragma once

#include <string>

#include "sprout/config/config.hpp"
#include "sprout/di/bean_factory.hpp"

namespace sprout::di {

// Container configuration, read from the "container" section
class ContainerConfig : public config::ConfigurationProperties {
public:
    // Package scanned at startup, empty for every registered component
    std::string base_package;
    bool strict_setter_injection = false;

    std::string properties_name() const override { return "container"; }
    void from_ptree(const boost::property_tree::ptree& section) override;
    void validate() const override;

    BeanFactoryOptions factory_options() const;
};

}  // namespace sprout::di
