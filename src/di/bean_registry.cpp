#include "sprout/di/bean_registry.hpp"

#include "sprout/di/exceptions.hpp"
#include "sprout/log/logger.hpp"

namespace sprout::di {

namespace {

void require_type(TypeRef type) {
    if (!type) {
        throw InvalidArgumentException("Type must be non-null.");
    }
}

void require_key(TypeRef type, const std::string& qualifier) {
    if (!type || qualifier.empty()) {
        throw InvalidArgumentException("Type and qualifier must be non-null.");
    }
}

}  // namespace

Instance BeanRegistry::find(TypeRef type, const std::string& qualifier) const {
    try {
        return resolve(type, qualifier);
    } catch (const BeanNotFoundException&) {
        return nullptr;
    }
}

std::shared_ptr<DefaultBeanRegistry::Bucket> DefaultBeanRegistry::find_bucket(
    TypeRef type) const {
    auto it = buckets_.find(type);
    return it != buckets_.end() ? it->second : nullptr;
}

void DefaultBeanRegistry::register_bean(TypeRef type,
                                        const std::string& qualifier,
                                        Instance instance) {
    if (!type || qualifier.empty() || !instance) {
        throw InvalidArgumentException(
            "Type, qualifier, and instance must be non-null.");
    }

    {
        std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
        if (auto bucket = find_bucket(type)) {
            std::lock_guard<std::mutex> lock(bucket->mutex);
            bucket->beans[qualifier] = std::move(instance);
            SPROUT_LOG_TRACE << "Registered bean " << type.name() << " ["
                             << qualifier << "]";
            return;
        }
    }

    // No bucket yet; another writer may create it between the two locks
    std::unique_lock<std::shared_mutex> map_lock(map_mutex_);
    auto& bucket = buckets_[type];
    if (!bucket) {
        bucket = std::make_shared<Bucket>();
    }
    std::lock_guard<std::mutex> lock(bucket->mutex);
    bucket->beans[qualifier] = std::move(instance);
    SPROUT_LOG_TRACE << "Registered bean " << type.name() << " [" << qualifier
                     << "]";
}

Instance DefaultBeanRegistry::resolve(TypeRef type,
                                      const std::string& qualifier) const {
    require_key(type, qualifier);

    std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
    auto bucket = find_bucket(type);
    if (!bucket) {
        throw BeanNotFoundException(type, qualifier, false);
    }

    std::lock_guard<std::mutex> lock(bucket->mutex);
    auto it = bucket->beans.find(qualifier);
    if (it == bucket->beans.end()) {
        throw BeanNotFoundException(type, qualifier, true);
    }
    return it->second;
}

Instance DefaultBeanRegistry::find(TypeRef type,
                                   const std::string& qualifier) const {
    require_key(type, qualifier);

    std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
    auto bucket = find_bucket(type);
    if (!bucket) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(bucket->mutex);
    auto it = bucket->beans.find(qualifier);
    return it != bucket->beans.end() ? it->second : nullptr;
}

bool DefaultBeanRegistry::contains_bean(TypeRef type,
                                        const std::string& qualifier) const {
    require_key(type, qualifier);

    std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
    auto bucket = find_bucket(type);
    if (!bucket) {
        return false;
    }
    std::lock_guard<std::mutex> lock(bucket->mutex);
    return bucket->beans.count(qualifier) > 0;
}

std::set<std::string> DefaultBeanRegistry::get_qualifiers(TypeRef type) const {
    require_type(type);

    std::set<std::string> qualifiers;
    std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
    if (auto bucket = find_bucket(type)) {
        std::lock_guard<std::mutex> lock(bucket->mutex);
        for (const auto& [qualifier, instance] : bucket->beans) {
            qualifiers.insert(qualifier);
        }
    }
    return qualifiers;
}

void DefaultBeanRegistry::deregister(TypeRef type,
                                     const std::string& qualifier) {
    require_key(type, qualifier);

    bool emptied = false;
    {
        std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
        auto bucket = find_bucket(type);
        if (!bucket) {
            return;
        }
        std::lock_guard<std::mutex> lock(bucket->mutex);
        bucket->beans.erase(qualifier);
        emptied = bucket->beans.empty();
    }
    if (emptied) {
        collapse_if_empty(type);
    }
}

bool DefaultBeanRegistry::deregister_instance(TypeRef type,
                                              const std::string& qualifier,
                                              const Instance& instance) {
    require_key(type, qualifier);

    bool emptied = false;
    {
        std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
        auto bucket = find_bucket(type);
        if (!bucket) {
            return false;
        }
        std::lock_guard<std::mutex> lock(bucket->mutex);
        auto entry = bucket->beans.find(qualifier);
        if (entry == bucket->beans.end() || entry->second != instance) {
            return false;
        }
        bucket->beans.erase(entry);
        emptied = bucket->beans.empty();
    }
    if (emptied) {
        collapse_if_empty(type);
    }
    return true;
}

void DefaultBeanRegistry::collapse_if_empty(TypeRef type) {
    // A writer may have refilled the bucket since it was seen empty. The
    // exclusive map lock keeps every other caller out of the bucket.
    std::unique_lock<std::shared_mutex> map_lock(map_mutex_);
    auto it = buckets_.find(type);
    if (it != buckets_.end() && it->second->beans.empty()) {
        buckets_.erase(it);
    }
}

std::size_t DefaultBeanRegistry::type_count() const {
    std::shared_lock<std::shared_mutex> map_lock(map_mutex_);
    return buckets_.size();
}

}  // namespace sprout::di
