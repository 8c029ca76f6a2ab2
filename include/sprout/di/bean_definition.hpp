#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sprout/di/component_descriptor.hpp"
#include "sprout/di/type_ref.hpp"

namespace sprout::di {

/**
 * @brief Declaration of a managed component
 *
 * Immutable once built. An absent qualifier means the bean lives under
 * DEFAULT_QUALIFIER in the registry.
 */
class BeanDefinition {
public:
    /**
     * @throws InvalidArgumentException if the type is empty, the descriptor is
     *         null, or the descriptor describes a different type
     */
    BeanDefinition(TypeRef bean_type, bool singleton,
                   std::optional<std::string> qualifier,
                   std::shared_ptr<const ComponentDescriptor> descriptor);

    // Singleton definition of T built from T's descriptor
    template <typename T, typename Key = T>
    static BeanDefinition of(std::optional<std::string> qualifier = std::nullopt,
                             bool singleton = true) {
        return BeanDefinition(TypeRef::of<Key>(), singleton,
                              std::move(qualifier),
                              describe_component<T, Key>());
    }

    TypeRef bean_type() const { return bean_type_; }
    bool is_singleton() const { return singleton_; }
    const std::optional<std::string>& qualifier() const { return qualifier_; }
    const ComponentDescriptor& descriptor() const { return *descriptor_; }

    // Qualifier the bean is stored under
    std::string registry_qualifier() const {
        return qualifier_.value_or(DEFAULT_QUALIFIER);
    }

private:
    TypeRef bean_type_;
    bool singleton_;
    std::optional<std::string> qualifier_;
    std::shared_ptr<const ComponentDescriptor> descriptor_;
};

/**
 * @brief Producer of the ordered declarations a context is refreshed from
 */
class BeanDefinitionSource {
public:
    virtual ~BeanDefinitionSource() = default;
    virtual std::vector<BeanDefinition> scan() const = 0;
};

}  // namespace sprout::di
