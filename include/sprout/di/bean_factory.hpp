#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sprout/di/bean_definition.hpp"
#include "sprout/di/bean_registry.hpp"
#include "sprout/di/construction_context.hpp"
#include "sprout/di/exceptions.hpp"

namespace sprout::di {

struct BeanFactoryOptions {
    // Reject marked methods that are not single-parameter setters
    bool strict_setter_injection = false;
};

// True for names that look like setters ("set" prefix)
bool is_setter_name(const std::string& name);

/**
 * @brief Builds fully wired component instances from their definitions
 *
 * Constructor injection first, then field injection, then setter injection.
 * Singletons are registered in the registry before their fields and setters
 * are injected, which lets a field or setter dependency refer back to the
 * bean under construction. If that injection fails, the bean is withdrawn
 * together with every singleton the same request registered after it.
 *
 * Dependencies missing from the registry are built on demand when the
 * factory knows their definition (see register_definition()).
 */
class BeanFactory {
public:
    explicit BeanFactory(std::shared_ptr<BeanRegistry> registry,
                         BeanFactoryOptions options = {});

    /**
     * @brief Create (or fetch, for a registered singleton) a bean
     * @throws BeanInstantiationException wrapping the failure
     */
    Instance create_bean(const BeanDefinition& definition);

    // Same, continuing an existing construction chain
    Instance create_bean(const BeanDefinition& definition,
                         ConstructionContext& context);

    template <typename T>
    std::shared_ptr<T> create_bean(const BeanDefinition& definition) {
        if (definition.bean_type() != TypeRef::of<T>()) {
            throw InvalidArgumentException(
                "Definition of " + definition.bean_type().name() +
                " does not produce " + TypeRef::of<T>().name());
        }
        return std::static_pointer_cast<T>(create_bean(definition));
    }

    // Later definitions for the same (type, qualifier) replace earlier ones
    void register_definition(const BeanDefinition& definition);
    void register_definitions(const std::vector<BeanDefinition>& definitions);

    std::optional<BeanDefinition> find_definition(
        TypeRef type, const std::string& qualifier) const;

    BeanRegistry& registry() const { return *registry_; }
    const BeanFactoryOptions& options() const { return options_; }

private:
    Instance do_create_bean(const BeanDefinition& definition,
                            ConstructionContext& context);

    const ConstructorDescriptor& select_constructor(
        const ComponentDescriptor& descriptor) const;

    Instance resolve_dependency(const InjectionPoint& point,
                                ConstructionContext& context);

    void inject_fields(const ComponentDescriptor& descriptor,
                       const Instance& object, ConstructionContext& context);

    void inject_setters(const ComponentDescriptor& descriptor,
                        const Instance& object, ConstructionContext& context);

    void withdraw_registrations(ConstructionContext& context, std::size_t mark);

    std::shared_ptr<BeanRegistry> registry_;
    BeanFactoryOptions options_;

    mutable std::shared_mutex definitions_mutex_;
    std::unordered_map<TypeRef, std::unordered_map<std::string, BeanDefinition>>
        definitions_;
};

}  // namespace sprout::di
