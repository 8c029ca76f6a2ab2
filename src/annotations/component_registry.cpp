#include "sprout/annotations/component_registry.hpp"

#include "sprout/log/logger.hpp"

namespace sprout::annotations {

void ComponentRegistry::add(ComponentMetadata metadata,
                            std::function<di::BeanDefinition()> factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(Entry{std::move(metadata), std::move(factory)});
}

std::vector<di::BeanDefinition> ComponentRegistry::definitions(
    const std::string& base_package) const {
    std::vector<di::BeanDefinition> result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (package_matches(entry.metadata.package, base_package)) {
            result.push_back(entry.factory());
        }
    }
    return result;
}

std::size_t ComponentRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool package_matches(const std::string& package,
                     const std::string& base_package) {
    if (base_package.empty() || package == base_package) {
        return true;
    }
    return package.size() > base_package.size() + 2 &&
           package.compare(0, base_package.size(), base_package) == 0 &&
           package.compare(base_package.size(), 2, "::") == 0;
}

ComponentScanner::ComponentScanner(std::string base_package,
                                   const ComponentRegistry& registry)
    : base_package_(std::move(base_package)), registry_(registry) {}

std::vector<di::BeanDefinition> ComponentScanner::scan() const {
    auto definitions = registry_.definitions(base_package_);
    SPROUT_LOG_INFO << "Scanned " << definitions.size() << " of "
                    << registry_.size() << " components under '"
                    << (base_package_.empty() ? "*" : base_package_) << "'";
    for (const auto& definition : definitions) {
        SPROUT_LOG_DEBUG << "Found component " << definition.bean_type().name()
                         << " [" << definition.registry_qualifier() << "]"
                         << (definition.is_singleton() ? "" : " (prototype)");
    }
    return definitions;
}

}  // namespace sprout::annotations
