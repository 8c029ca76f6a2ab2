#pragma once

#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "sprout/di/type_ref.hpp"

namespace sprout::di {

/// Qualifier used when a bean or injection point names none
inline constexpr const char* DEFAULT_QUALIFIER = "__default__";

/// A managed object, pointing at an instance of exactly its registered type
using Instance = std::shared_ptr<void>;

/**
 * @brief Store of managed instances keyed by (type, qualifier)
 *
 * Keys match by exact type identity and exact qualifier string. A pair maps
 * to at most one instance; registering again replaces the previous one.
 * Implementations must be safe for concurrent use without caller locking.
 */
class BeanRegistry {
public:
    virtual ~BeanRegistry() = default;

    /**
     * @brief Store an instance under (type, qualifier)
     * @throws InvalidArgumentException if type is empty, qualifier is empty
     *         or instance is null
     */
    virtual void register_bean(TypeRef type, const std::string& qualifier,
                               Instance instance) = 0;

    /**
     * @brief Look up the instance stored under (type, qualifier)
     * @throws BeanNotFoundException if there is no such entry
     */
    virtual Instance resolve(TypeRef type,
                             const std::string& qualifier) const = 0;

    virtual bool contains_bean(TypeRef type,
                               const std::string& qualifier) const = 0;

    /**
     * @brief Single-step lookup
     * @return the instance, or null if there is no such entry
     */
    virtual Instance find(TypeRef type, const std::string& qualifier) const;

    /**
     * @brief Snapshot of the qualifiers registered for a type
     * @return empty set for an unregistered type
     */
    virtual std::set<std::string> get_qualifiers(TypeRef type) const = 0;

    // Removing a missing entry is a no-op
    virtual void deregister(TypeRef type, const std::string& qualifier) = 0;

    /**
     * @brief Remove (type, qualifier) only while it still maps to instance
     * @return true if the entry was removed
     */
    virtual bool deregister_instance(TypeRef type, const std::string& qualifier,
                                     const Instance& instance) = 0;

    void register_bean(TypeRef type, Instance instance) {
        register_bean(type, DEFAULT_QUALIFIER, std::move(instance));
    }

    Instance resolve(TypeRef type) const {
        return resolve(type, DEFAULT_QUALIFIER);
    }

    bool contains_bean(TypeRef type) const {
        return contains_bean(type, DEFAULT_QUALIFIER);
    }

    void deregister(TypeRef type) { deregister(type, DEFAULT_QUALIFIER); }

    // Typed convenience wrappers

    template <typename T>
    void register_bean(std::shared_ptr<T> instance,
                       const std::string& qualifier = DEFAULT_QUALIFIER) {
        register_bean(TypeRef::of<T>(), qualifier,
                      std::static_pointer_cast<void>(std::move(instance)));
    }

    template <typename T>
    std::shared_ptr<T> resolve(
        const std::string& qualifier = DEFAULT_QUALIFIER) const {
        return std::static_pointer_cast<T>(
            resolve(TypeRef::of<T>(), qualifier));
    }

    template <typename T>
    bool contains_bean(const std::string& qualifier = DEFAULT_QUALIFIER) const {
        return contains_bean(TypeRef::of<T>(), qualifier);
    }

    template <typename T>
    std::set<std::string> get_qualifiers() const {
        return get_qualifiers(TypeRef::of<T>());
    }

    template <typename T>
    void deregister(const std::string& qualifier = DEFAULT_QUALIFIER) {
        deregister(TypeRef::of<T>(), qualifier);
    }
};

/**
 * @brief Default thread-safe registry
 *
 * One bucket per type, each with its own mutex. Operations on existing
 * buckets hold the map lock shared, so work on different types proceeds in
 * parallel. Only creating a bucket or dropping an empty one takes the map
 * lock exclusively.
 */
class DefaultBeanRegistry : public BeanRegistry {
public:
    DefaultBeanRegistry() = default;
    ~DefaultBeanRegistry() override = default;

    DefaultBeanRegistry(const DefaultBeanRegistry&) = delete;
    DefaultBeanRegistry& operator=(const DefaultBeanRegistry&) = delete;

    using BeanRegistry::contains_bean;
    using BeanRegistry::deregister;
    using BeanRegistry::get_qualifiers;
    using BeanRegistry::register_bean;
    using BeanRegistry::resolve;

    void register_bean(TypeRef type, const std::string& qualifier,
                       Instance instance) override;
    Instance resolve(TypeRef type,
                     const std::string& qualifier) const override;
    bool contains_bean(TypeRef type,
                       const std::string& qualifier) const override;
    Instance find(TypeRef type, const std::string& qualifier) const override;
    std::set<std::string> get_qualifiers(TypeRef type) const override;
    void deregister(TypeRef type, const std::string& qualifier) override;
    bool deregister_instance(TypeRef type, const std::string& qualifier,
                             const Instance& instance) override;

    // Number of types with at least one registered instance
    std::size_t type_count() const;

private:
    struct Bucket {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Instance> beans;
    };

    std::shared_ptr<Bucket> find_bucket(TypeRef type) const;

    // Drop the bucket for type if it is still empty
    void collapse_if_empty(TypeRef type);

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<TypeRef, std::shared_ptr<Bucket>> buckets_;
};

}  // namespace sprout::di
