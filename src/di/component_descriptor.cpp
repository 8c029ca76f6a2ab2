#include "sprout/di/component_descriptor.hpp"

namespace sprout::di {

const char* to_string(InjectionPointKind kind) {
    switch (kind) {
        case InjectionPointKind::CONSTRUCTOR:
            return "constructor";
        case InjectionPointKind::FIELD:
            return "field";
        case InjectionPointKind::SETTER:
            return "setter";
    }
    return "unknown";
}

ComponentDescriptor::ComponentDescriptor(
    TypeRef type, TypeRef implementation,
    std::vector<ConstructorDescriptor> constructors,
    std::vector<FieldDescriptor> fields, std::vector<MethodDescriptor> methods,
    std::function<Instance(const Instance&)> expose)
    : type_(type),
      implementation_(implementation),
      constructors_(std::move(constructors)),
      fields_(std::move(fields)),
      methods_(std::move(methods)),
      expose_(std::move(expose)) {
    if (!type_ || !implementation_ || !expose_) {
        throw InvalidArgumentException(
            "Component descriptor requires a type, an implementation and an "
            "exposing function.");
    }
}

}  // namespace sprout::di
