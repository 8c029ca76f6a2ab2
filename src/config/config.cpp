#include "sprout/config/config.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "sprout/log/logger.hpp"

namespace sprout::config {

ConfigFormat format_from_path(const std::string& config_file) {
    if (boost::algorithm::iends_with(config_file, ".json")) {
        return ConfigFormat::JSON;
    }
    if (boost::algorithm::iends_with(config_file, ".ini")) {
        return ConfigFormat::INI;
    }
    return ConfigFormat::YAML;
}

boost::property_tree::ptree ConfigManager::yaml_to_ptree(
    const YAML::Node& node) {
    boost::property_tree::ptree pt;
    if (node.IsMap()) {
        for (const auto& entry : node) {
            pt.add_child(entry.first.as<std::string>(),
                         yaml_to_ptree(entry.second));
        }
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            pt.push_back({"", yaml_to_ptree(item)});
        }
    } else if (node.IsScalar()) {
        pt.put_value(node.as<std::string>());
    }
    return pt;
}

boost::property_tree::ptree ConfigManager::parse(const std::string& config_file,
                                                 ConfigFormat format) {
    if (format == ConfigFormat::YAML) {
        return yaml_to_ptree(YAML::LoadFile(config_file));
    }

    std::ifstream ifs(config_file);
    if (!ifs) {
        throw std::runtime_error("Cannot open " + config_file);
    }
    boost::property_tree::ptree tree;
    if (format == ConfigFormat::JSON) {
        boost::property_tree::read_json(ifs, tree);
    } else {
        boost::property_tree::read_ini(ifs, tree);
    }
    return tree;
}

void ConfigManager::populate(ConfigurationProperties& properties,
                             const boost::property_tree::ptree& tree) {
    const std::string name = properties.properties_name();
    auto subtree = tree.get_child_optional(name);
    if (!subtree) {
        SPROUT_LOG_DEBUG << "No '" << name << "' section, using defaults";
        return;
    }
    properties.from_ptree(*subtree);
    properties.validate();
}

void ConfigManager::apply(boost::property_tree::ptree tree,
                          const std::string& only_section) {
    using Staged =
        std::pair<const Section*, std::shared_ptr<ConfigurationProperties>>;
    std::vector<Staged> staged;
    for (const auto& section : sections_) {
        if (!only_section.empty() &&
            section.properties->properties_name() != only_section) {
            continue;
        }
        staged.emplace_back(&section, section.stage(tree));
    }

    tree_ = std::move(tree);
    for (const auto& [section, properties] : staged) {
        section->commit(*properties);
        SPROUT_LOG_DEBUG << "Loaded '" << properties->properties_name()
                         << "' section";
    }
}

void ConfigManager::load_config(const std::string& config_file) {
    load_config(config_file, format_from_path(config_file));
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    SPROUT_LOG_INFO << "Loading config file: " << config_file;

    try {
        auto tree = parse(config_file, format);
        std::lock_guard<std::mutex> lock(mutex_);
        apply(std::move(tree));
        loaded_file_ = config_file;
    } catch (const std::exception& e) {
        SPROUT_LOG_ERROR << "Failed to load config file: " << config_file
                         << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }
}

void ConfigManager::set_property(const std::string& path,
                                 const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tree = tree_;
    tree.put(path, value);
    try {
        apply(std::move(tree), path.substr(0, path.find('.')));
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid value for " + path + ": " +
                                 e.what());
    }
}

boost::property_tree::ptree ConfigManager::config_tree() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tree_;
}

std::string ConfigManager::loaded_file() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_file_;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    tree_ = boost::property_tree::ptree();
    loaded_file_.clear();
}

}  // namespace sprout::config
