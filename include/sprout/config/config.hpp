#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ptree.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <typeindex>
#include <vector>

namespace sprout::config {

inline constexpr const char* DEFAULT_CONFIG_FILE = "config/sprout.yaml";

enum class ConfigFormat { YAML, JSON, INI };

// Format implied by the file extension, YAML when unknown
ConfigFormat format_from_path(const std::string& config_file);

/**
 * @brief Typed view of one top-level section of the configuration tree
 */
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;

    // Name of the section this object is read from
    virtual std::string properties_name() const = 0;
    virtual void from_ptree(const boost::property_tree::ptree& section) = 0;
    virtual void validate() const {}

protected:
    // Overwrite target with the value at path, if the path is present
    template <typename T>
    static void read(const boost::property_tree::ptree& section,
                     const std::string& path, T& target) {
        target = section.get<T>(path, target);
    }
};

/**
 * @brief Process-wide configuration: the loaded tree plus the typed
 * sections bound to it
 *
 * Sections are refreshed on every load_config() and set_property() that
 * touches them, and always reflect their defaults overlaid with the tree.
 * A change is validated against fresh copies of the affected sections
 * first; when any of them rejects it, neither the tree nor the bound
 * sections change.
 */
class ConfigManager {
public:
    static ConfigManager& instance() {
        static ConfigManager instance;
        return instance;
    }

    /**
     * @brief Bind a section of type T, creating it on first use
     * @return the bound instance, shared by every later caller
     */
    template <typename T>
    std::shared_ptr<T> bind() {
        static_assert(std::is_base_of_v<ConfigurationProperties, T>,
                      "T must inherit from ConfigurationProperties");
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : sections_) {
            if (entry.type == std::type_index(typeid(T))) {
                return std::static_pointer_cast<T>(entry.properties);
            }
        }
        auto properties = std::make_shared<T>();
        populate(*properties, tree_);
        sections_.push_back(Section{
            std::type_index(typeid(T)), properties,
            [](const boost::property_tree::ptree& tree)
                -> std::shared_ptr<ConfigurationProperties> {
                auto staged = std::make_shared<T>();
                populate(*staged, tree);
                return staged;
            },
            [properties](const ConfigurationProperties& staged) {
                *properties = static_cast<const T&>(staged);
            }});
        return properties;
    }

    // Bound section of type T, or nullptr
    template <typename T>
    std::shared_ptr<T> section() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : sections_) {
            if (entry.type == std::type_index(typeid(T))) {
                return std::static_pointer_cast<T>(entry.properties);
            }
        }
        return nullptr;
    }

    /**
     * @brief Replace the configuration tree with the contents of a file
     * @throws std::runtime_error if the file cannot be read or a bound
     *         section rejects its values
     */
    void load_config(const std::string& config_file);
    void load_config(const std::string& config_file, ConfigFormat format);

    /**
     * @brief Override a single value, e.g. ("container.base_package", "app")
     * @throws std::runtime_error if the owning section rejects the value
     */
    void set_property(const std::string& path, const std::string& value);

    boost::property_tree::ptree config_tree() const;

    // Last file loaded, empty when running on defaults
    std::string loaded_file() const;

    // Forget the tree and every bound section
    void reset();

private:
    struct Section {
        std::type_index type;
        std::shared_ptr<ConfigurationProperties> properties;
        // Fresh, validated instance read from a tree
        std::function<std::shared_ptr<ConfigurationProperties>(
            const boost::property_tree::ptree&)>
            stage;
        // Copy a staged instance into properties
        std::function<void(const ConfigurationProperties&)> commit;
    };

    ConfigManager() = default;

    static void populate(ConfigurationProperties& properties,
                         const boost::property_tree::ptree& tree);

    /**
     * @brief Make tree current, refreshing the bound sections
     *
     * Only the section named only_section is refreshed when it is given.
     * Caller holds mutex_.
     */
    void apply(boost::property_tree::ptree tree,
               const std::string& only_section = "");

    static boost::property_tree::ptree parse(const std::string& config_file,
                                             ConfigFormat format);
    static boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);

    mutable std::mutex mutex_;
    std::vector<Section> sections_;
    boost::property_tree::ptree tree_;
    std::string loaded_file_;
};

}  // namespace sprout::config
