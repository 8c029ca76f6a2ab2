#include "sprout/di/construction_context.hpp"

#include <algorithm>

#include "sprout/di/exceptions.hpp"

namespace sprout::di {

void ConstructionContext::enter(TypeRef type) {
    if (in_flight_.count(type)) {
        throw CyclicDependencyException(type, chain_);
    }
    in_flight_.insert(type);
    chain_.push_back(type);
}

void ConstructionContext::leave(TypeRef type) {
    in_flight_.erase(type);
    auto it = std::find(chain_.rbegin(), chain_.rend(), type);
    if (it != chain_.rend()) {
        chain_.erase(std::next(it).base());
    }
}

void ConstructionContext::record_registration(TypeRef type,
                                              const std::string& qualifier,
                                              Instance instance) {
    registrations_.push_back(Registration{type, qualifier, std::move(instance)});
}

std::vector<ConstructionContext::Registration>
ConstructionContext::take_registrations_since(std::size_t mark) {
    std::vector<Registration> taken;
    while (registrations_.size() > mark) {
        taken.push_back(std::move(registrations_.back()));
        registrations_.pop_back();
    }
    return taken;
}

}  // namespace sprout::di
