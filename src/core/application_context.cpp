#include "sprout/core/application_context.hpp"

#include "sprout/log/logger.hpp"

namespace sprout::core {

namespace {

std::shared_ptr<di::BeanRegistry> or_default(
    std::shared_ptr<di::BeanRegistry> registry) {
    if (registry) {
        return registry;
    }
    return std::make_shared<di::DefaultBeanRegistry>();
}

}  // namespace

ApplicationContext::ApplicationContext(
    std::shared_ptr<const di::BeanDefinitionSource> source,
    std::shared_ptr<di::BeanRegistry> registry, di::BeanFactoryOptions options)
    : source_(std::move(source)),
      registry_(or_default(std::move(registry))),
      factory_(registry_, options) {
    if (!source_) {
        throw di::InvalidArgumentException(
            "Bean definition source must be non-null.");
    }
}

ApplicationContext::ApplicationContext(
    std::vector<di::BeanDefinition> definitions,
    std::shared_ptr<di::BeanRegistry> registry, di::BeanFactoryOptions options)
    : definitions_(std::move(definitions)),
      registry_(or_default(std::move(registry))),
      factory_(registry_, options) {}

void ApplicationContext::refresh() {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    if (refreshed_) {
        return;
    }

    if (source_) {
        definitions_ = source_->scan();
    }
    factory_.register_definitions(definitions_);

    SPROUT_LOG_INFO << "Refreshing application context with "
                    << definitions_.size() << " bean definitions";
    std::size_t singletons = 0;
    for (const auto& definition : definitions_) {
        if (!definition.is_singleton()) {
            continue;
        }
        factory_.create_bean(definition);
        ++singletons;
    }

    refreshed_ = true;
    SPROUT_LOG_INFO << "Application context refreshed, " << singletons
                    << " singletons ready";
}

bool ApplicationContext::is_refreshed() const {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    return refreshed_;
}

std::vector<di::BeanDefinition> ApplicationContext::definitions() const {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    return definitions_;
}

}  // namespace sprout::core
