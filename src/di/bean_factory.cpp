#include "sprout/di/bean_factory.hpp"

#include <mutex>

#include "sprout/log/logger.hpp"

namespace sprout::di {

bool is_setter_name(const std::string& name) {
    return name.rfind("set", 0) == 0;
}

BeanFactory::BeanFactory(std::shared_ptr<BeanRegistry> registry,
                         BeanFactoryOptions options)
    : registry_(std::move(registry)), options_(options) {
    if (!registry_) {
        throw InvalidArgumentException("Bean registry must be non-null.");
    }
}

Instance BeanFactory::create_bean(const BeanDefinition& definition) {
    ConstructionContext context;
    return create_bean(definition, context);
}

Instance BeanFactory::create_bean(const BeanDefinition& definition,
                                  ConstructionContext& context) {
    try {
        return do_create_bean(definition, context);
    } catch (const BeanInstantiationException&) {
        throw;
    } catch (const std::exception& e) {
        SPROUT_LOG_ERROR << "Failed to create bean "
                         << definition.bean_type().name() << " ["
                         << definition.registry_qualifier() << "]: "
                         << e.what();
        throw BeanInstantiationException(definition.bean_type(),
                                         std::current_exception());
    }
}

Instance BeanFactory::do_create_bean(const BeanDefinition& definition,
                                     ConstructionContext& context) {
    const TypeRef type = definition.bean_type();
    const std::string qualifier = definition.registry_qualifier();

    if (definition.is_singleton()) {
        if (auto existing = registry_->find(type, qualifier)) {
            return existing;
        }
    }

    const ComponentDescriptor& descriptor = definition.descriptor();
    ConstructionGuard guard(context, descriptor.implementation());
    SPROUT_LOG_DEBUG << "Creating bean " << type.name() << " [" << qualifier
                     << "]";

    const ConstructorDescriptor& constructor = select_constructor(descriptor);
    std::vector<Instance> args;
    args.reserve(constructor.parameters.size());
    for (const auto& parameter : constructor.parameters) {
        args.push_back(resolve_dependency(parameter, context));
    }

    Instance object = constructor.invoker(args);
    Instance bean = descriptor.expose(object);

    const std::size_t mark = context.registration_count();
    if (definition.is_singleton()) {
        registry_->register_bean(type, qualifier, bean);
        context.record_registration(type, qualifier, bean);
    }

    try {
        inject_fields(descriptor, object, context);
        inject_setters(descriptor, object, context);
    } catch (...) {
        // Beans registered since this one may hold it half-injected
        withdraw_registrations(context, mark);
        throw;
    }

    SPROUT_LOG_DEBUG << "Created bean " << type.name() << " [" << qualifier
                     << "]";
    return bean;
}

const ConstructorDescriptor& BeanFactory::select_constructor(
    const ComponentDescriptor& descriptor) const {
    const ConstructorDescriptor* marked = nullptr;
    std::size_t marked_count = 0;
    for (const auto& constructor : descriptor.constructors()) {
        if (constructor.inject) {
            if (!marked) {
                marked = &constructor;
            }
            ++marked_count;
        }
    }

    if (marked_count > 1) {
        throw AmbiguousConstructorException(descriptor.implementation(),
                                            marked_count);
    }
    if (marked) {
        return *marked;
    }

    for (const auto& constructor : descriptor.constructors()) {
        if (constructor.parameters.empty()) {
            return constructor;
        }
    }
    throw NoViableConstructorException(descriptor.implementation());
}

Instance BeanFactory::resolve_dependency(const InjectionPoint& point,
                                         ConstructionContext& context) {
    const std::string qualifier = point.registry_qualifier();

    if (auto registered = registry_->find(point.type, qualifier)) {
        return registered;
    }

    if (auto definition = find_definition(point.type, qualifier)) {
        SPROUT_LOG_TRACE << "Building " << to_string(point.kind)
                         << " dependency " << point.type.name() << " ["
                         << qualifier << "]";
        return create_bean(*definition, context);
    }

    return registry_->resolve(point.type, qualifier);
}

void BeanFactory::inject_fields(const ComponentDescriptor& descriptor,
                                const Instance& object,
                                ConstructionContext& context) {
    for (const auto& field : descriptor.fields()) {
        if (field.is_static) {
            throw InvalidTargetException(descriptor.implementation(),
                                         field.name,
                                         "static fields cannot be injected");
        }
        if (field.immutable || !field.assign) {
            throw InvalidTargetException(descriptor.implementation(),
                                         field.name,
                                         "const fields cannot be injected");
        }
        field.assign(object, resolve_dependency(field.point, context));
    }
}

void BeanFactory::inject_setters(const ComponentDescriptor& descriptor,
                                 const Instance& object,
                                 ConstructionContext& context) {
    for (const auto& method : descriptor.methods()) {
        const bool conforming = !method.is_static && method.arity == 1 &&
                                is_setter_name(method.name) &&
                                static_cast<bool>(method.invoke);
        if (!conforming) {
            if (options_.strict_setter_injection) {
                throw InvalidTargetException(
                    descriptor.implementation(), method.name,
                    "injected methods must be non-static, take one parameter "
                    "and start with 'set'");
            }
            SPROUT_LOG_DEBUG << "Skipping method "
                             << descriptor.implementation().name()
                             << "::" << method.name
                             << ": not a single-parameter setter";
            continue;
        }

        std::vector<Instance> args;
        args.push_back(resolve_dependency(method.parameters.front(), context));
        method.invoke(object, args);
    }
}

void BeanFactory::withdraw_registrations(ConstructionContext& context,
                                         std::size_t mark) {
    for (const auto& registration : context.take_registrations_since(mark)) {
        if (registry_->deregister_instance(registration.type,
                                           registration.qualifier,
                                           registration.instance)) {
            SPROUT_LOG_DEBUG << "Withdrew bean " << registration.type.name()
                             << " [" << registration.qualifier << "]";
        }
    }
}

void BeanFactory::register_definition(const BeanDefinition& definition) {
    std::unique_lock<std::shared_mutex> lock(definitions_mutex_);
    auto& by_qualifier = definitions_[definition.bean_type()];
    by_qualifier.insert_or_assign(definition.registry_qualifier(), definition);
}

void BeanFactory::register_definitions(
    const std::vector<BeanDefinition>& definitions) {
    for (const auto& definition : definitions) {
        register_definition(definition);
    }
}

std::optional<BeanDefinition> BeanFactory::find_definition(
    TypeRef type, const std::string& qualifier) const {
    std::shared_lock<std::shared_mutex> lock(definitions_mutex_);
    auto it = definitions_.find(type);
    if (it == definitions_.end()) {
        return std::nullopt;
    }
    auto entry = it->second.find(qualifier);
    if (entry == it->second.end()) {
        return std::nullopt;
    }
    return entry->second;
}

}  // namespace sprout::di
