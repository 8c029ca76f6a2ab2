#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sprout/di/bean_definition.hpp"

namespace sprout::annotations {

/**
 * @brief Component annotation metadata
 */
struct ComponentMetadata {
    std::string package;  // "::"-separated, e.g. "app::web"
    std::optional<std::string> qualifier;
    bool singleton = true;
};

/**
 * @brief Process-wide catalog of components declared with the
 * SPROUT_*COMPONENT macros
 *
 * Entries keep registration order. Within one translation unit that is
 * declaration order; across translation units it follows static
 * initialization order.
 */
class ComponentRegistry {
public:
    static ComponentRegistry& instance() {
        static ComponentRegistry registry;
        return registry;
    }

    /**
     * @brief Register a component exposed as Key
     *
     * The definition is built lazily when the catalog is scanned, so metadata
     * errors surface from the scan rather than during static initialization.
     */
    template <typename T, typename Key = T>
    static bool register_component(ComponentMetadata metadata) {
        auto qualifier = metadata.qualifier;
        const bool singleton = metadata.singleton;
        instance().add(std::move(metadata), [qualifier, singleton]() {
            return di::BeanDefinition::of<T, Key>(qualifier, singleton);
        });
        return true;
    }

    // Definitions of every component at or below base_package
    std::vector<di::BeanDefinition> definitions(
        const std::string& base_package) const;

    std::size_t size() const;

private:
    struct Entry {
        ComponentMetadata metadata;
        std::function<di::BeanDefinition()> factory;
    };

    ComponentRegistry() = default;

    void add(ComponentMetadata metadata,
             std::function<di::BeanDefinition()> factory);

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

/**
 * @brief True if package equals base_package or lies below it
 *
 * Matches on "::" boundaries only: "app::web" contains "app::web::api" but
 * not "app::webx". An empty base package matches everything.
 */
bool package_matches(const std::string& package,
                     const std::string& base_package);

/**
 * @brief Definition source backed by the component catalog
 */
class ComponentScanner : public di::BeanDefinitionSource {
public:
    explicit ComponentScanner(
        std::string base_package = "",
        const ComponentRegistry& registry = ComponentRegistry::instance());

    std::vector<di::BeanDefinition> scan() const override;

    const std::string& base_package() const { return base_package_; }

private:
    std::string base_package_;
    const ComponentRegistry& registry_;
};

}  // namespace sprout::annotations

#define SPROUT_DETAIL_CONCAT_IMPL(a, b) a##b
#define SPROUT_DETAIL_CONCAT(a, b) SPROUT_DETAIL_CONCAT_IMPL(a, b)

#define SPROUT_DETAIL_REGISTER(Type, Key, package, qualifier, singleton)   \
    [[maybe_unused]] static const bool SPROUT_DETAIL_CONCAT(                \
        sprout_component_reg_, __COUNTER__) =                               \
        ::sprout::annotations::ComponentRegistry::register_component<Type,  \
                                                                     Key>(  \
            ::sprout::annotations::ComponentMetadata{package, qualifier,    \
                                                     singleton})

// Singleton component registered under its own type
#define SPROUT_COMPONENT(Type, package) \
    SPROUT_DETAIL_REGISTER(Type, Type, package, std::nullopt, true)

// Singleton component registered under its own type and a qualifier
#define SPROUT_NAMED_COMPONENT(Type, package, qualifier) \
    SPROUT_DETAIL_REGISTER(Type, Type, package, std::string(qualifier), true)

// Transient component: a new instance per injection point
#define SPROUT_PROTOTYPE_COMPONENT(Type, package) \
    SPROUT_DETAIL_REGISTER(Type, Type, package, std::nullopt, false)

// Singleton component registered under the interface Key
#define SPROUT_COMPONENT_AS(Type, Key, package) \
    SPROUT_DETAIL_REGISTER(Type, Key, package, std::nullopt, true)

// Singleton component registered under the interface Key and a qualifier
#define SPROUT_NAMED_COMPONENT_AS(Type, Key, package, qualifier)              \
    SPROUT_DETAIL_REGISTER(Type, Key, package, std::string(qualifier), true)
