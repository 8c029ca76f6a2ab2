#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "sprout/di/bean_registry.hpp"
#include "sprout/di/type_ref.hpp"

namespace sprout::di {

/**
 * @brief Types under construction in one call chain, plus the singletons
 * the chain has registered so far
 *
 * Never shared between independent construction requests.
 */
class ConstructionContext {
public:
    struct Registration {
        TypeRef type;
        std::string qualifier;
        Instance instance;
    };

    /**
     * @brief Mark a type as in flight
     * @throws CyclicDependencyException if the type is already in flight
     */
    void enter(TypeRef type);
    void leave(TypeRef type);

    bool is_constructing(TypeRef type) const {
        return in_flight_.count(type) > 0;
    }

    // Outermost first
    const std::vector<TypeRef>& chain() const { return chain_; }

    std::size_t depth() const { return chain_.size(); }

    void record_registration(TypeRef type, const std::string& qualifier,
                             Instance instance);

    std::size_t registration_count() const { return registrations_.size(); }

    /**
     * @brief Forget the registrations recorded at or after mark
     * @return the forgotten entries, newest first
     */
    std::vector<Registration> take_registrations_since(std::size_t mark);

private:
    std::unordered_set<TypeRef> in_flight_;
    std::vector<TypeRef> chain_;
    std::vector<Registration> registrations_;
};

/**
 * @brief Keeps a type in flight for the guard's lifetime
 */
class ConstructionGuard {
public:
    ConstructionGuard(ConstructionContext& context, TypeRef type)
        : context_(context), type_(type) {
        context_.enter(type_);
    }

    ~ConstructionGuard() { context_.leave(type_); }

    ConstructionGuard(const ConstructionGuard&) = delete;
    ConstructionGuard& operator=(const ConstructionGuard&) = delete;

private:
    ConstructionContext& context_;
    TypeRef type_;
};

}  // namespace sprout::di
