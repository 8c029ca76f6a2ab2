#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sprout/di/bean_definition.hpp"
#include "sprout/di/bean_factory.hpp"
#include "sprout/di/bean_registry.hpp"

namespace sprout::core {

/**
 * @brief Container facade: builds every singleton once, then answers lookups
 *
 * refresh() completes at most once. A failed refresh is not rolled back: the
 * beans built before the failure stay registered and the context stays
 * un-refreshed. A later refresh() walks the definitions again, reusing the
 * registered singletons.
 */
class ApplicationContext {
public:
    /**
     * @param source producer of the definitions, scanned on refresh()
     * @param registry registry to populate, a DefaultBeanRegistry if null
     */
    explicit ApplicationContext(
        std::shared_ptr<const di::BeanDefinitionSource> source,
        std::shared_ptr<di::BeanRegistry> registry = nullptr,
        di::BeanFactoryOptions options = {});

    // Refresh from a fixed list of definitions
    explicit ApplicationContext(
        std::vector<di::BeanDefinition> definitions,
        std::shared_ptr<di::BeanRegistry> registry = nullptr,
        di::BeanFactoryOptions options = {});

    ApplicationContext(const ApplicationContext&) = delete;
    ApplicationContext& operator=(const ApplicationContext&) = delete;

    /**
     * @brief Instantiate every singleton definition, in order
     * @throws BeanInstantiationException from the first failing definition
     */
    void refresh();

    bool is_refreshed() const;

    template <typename T>
    std::shared_ptr<T> get_bean() const {
        return registry_->resolve<T>();
    }

    template <typename T>
    std::shared_ptr<T> get_bean(const std::string& qualifier) const {
        return registry_->resolve<T>(qualifier);
    }

    template <typename T>
    bool contains_bean() const {
        return registry_->contains_bean<T>();
    }

    template <typename T>
    bool contains_bean(const std::string& qualifier) const {
        return registry_->contains_bean<T>(qualifier);
    }

    di::BeanRegistry& registry() const { return *registry_; }
    di::BeanFactory& bean_factory() { return factory_; }

    // Definitions seen by the last refresh()
    std::vector<di::BeanDefinition> definitions() const;

private:
    std::shared_ptr<const di::BeanDefinitionSource> source_;
    std::vector<di::BeanDefinition> definitions_;
    std::shared_ptr<di::BeanRegistry> registry_;
    di::BeanFactory factory_;

    mutable std::mutex refresh_mutex_;
    bool refreshed_ = false;
};

}  // namespace sprout::core
