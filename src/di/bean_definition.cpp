#include "sprout/di/bean_definition.hpp"

#include "sprout/di/exceptions.hpp"

namespace sprout::di {

BeanDefinition::BeanDefinition(
    TypeRef bean_type, bool singleton, std::optional<std::string> qualifier,
    std::shared_ptr<const ComponentDescriptor> descriptor)
    : bean_type_(bean_type),
      singleton_(singleton),
      qualifier_(std::move(qualifier)),
      descriptor_(std::move(descriptor)) {
    if (!bean_type_) {
        throw InvalidArgumentException("Bean type must be non-null.");
    }
    if (!descriptor_) {
        throw InvalidArgumentException("Bean descriptor must be non-null for " +
                                       bean_type_.name());
    }
    if (descriptor_->type() != bean_type_) {
        throw InvalidArgumentException(
            "Descriptor of " + descriptor_->type().name() +
            " cannot define a bean of type " + bean_type_.name());
    }
    if (qualifier_ && qualifier_->empty()) {
        qualifier_.reset();
    }
}

}  // namespace sprout::di
