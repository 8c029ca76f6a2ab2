#include "sprout/di/exceptions.hpp"

#include <sstream>

namespace sprout::di {

namespace {

struct CauseInfo {
    ErrorCode code = ErrorCode::INSTANTIATION_FAILED;
    std::string message = "unknown error";
};

CauseInfo describe_cause(const std::exception_ptr& cause) {
    CauseInfo info;
    if (!cause) {
        return info;
    }
    try {
        std::rethrow_exception(cause);
    } catch (const ContainerException& e) {
        info.code = e.code();
        info.message = e.what();
    } catch (const std::exception& e) {
        info.message = e.what();
    }
    return info;
}

}  // namespace

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_FOUND:
            return "NOT_FOUND";
        case ErrorCode::AMBIGUOUS_CONSTRUCTOR:
            return "AMBIGUOUS_CONSTRUCTOR";
        case ErrorCode::NO_VIABLE_CONSTRUCTOR:
            return "NO_VIABLE_CONSTRUCTOR";
        case ErrorCode::CYCLIC_DEPENDENCY:
            return "CYCLIC_DEPENDENCY";
        case ErrorCode::INVALID_TARGET:
            return "INVALID_TARGET";
        case ErrorCode::INSTANTIATION_FAILED:
            return "INSTANTIATION_FAILED";
    }
    return "UNKNOWN";
}

BeanNotFoundException::BeanNotFoundException(TypeRef type,
                                             const std::string& qualifier,
                                             bool type_known)
    : ContainerException(
          ErrorCode::NOT_FOUND,
          type_known ? "No bean found for qualifier: " + qualifier +
                           " of type: " + type.name()
                     : "No beans found of type: " + type.name()),
      type_(type),
      qualifier_(qualifier) {}

AmbiguousConstructorException::AmbiguousConstructorException(
    TypeRef type, std::size_t marked_count)
    : ConstructorSelectionException(
          ErrorCode::AMBIGUOUS_CONSTRUCTOR, type,
          std::to_string(marked_count) +
              " constructors marked for injection in " + type.name() +
              ", exactly one is allowed") {}

NoViableConstructorException::NoViableConstructorException(TypeRef type)
    : ConstructorSelectionException(
          ErrorCode::NO_VIABLE_CONSTRUCTOR, type,
          "No constructor marked for injection and no zero-argument "
          "constructor available for " +
              type.name()) {}

namespace {

std::string describe_cycle(TypeRef type, const std::vector<TypeRef>& chain) {
    std::ostringstream oss;
    oss << "Cyclic dependency detected for type: " << type.name() << " (";
    for (const auto& link : chain) {
        oss << link.name() << " -> ";
    }
    oss << type.name() << ")";
    return oss.str();
}

}  // namespace

CyclicDependencyException::CyclicDependencyException(TypeRef type,
                                                     std::vector<TypeRef> chain)
    : ContainerException(ErrorCode::CYCLIC_DEPENDENCY,
                         describe_cycle(type, chain)),
      type_(type),
      chain_(std::move(chain)) {}

InvalidTargetException::InvalidTargetException(TypeRef owner,
                                               const std::string& member,
                                               const std::string& reason)
    : ContainerException(ErrorCode::INVALID_TARGET,
                         "Cannot inject into " + owner.name() + "::" + member +
                             ": " + reason),
      owner_(owner),
      member_(member) {}

BeanInstantiationException::BeanInstantiationException(TypeRef type,
                                                       std::exception_ptr cause)
    : ContainerException(ErrorCode::INSTANTIATION_FAILED,
                         "Unable to instantiate bean of type: " + type.name() +
                             ": " + describe_cause(cause).message),
      bean_type_(type),
      root_cause_(describe_cause(cause).code),
      cause_(std::move(cause)) {}

void BeanInstantiationException::rethrow_cause() const {
    if (cause_) {
        std::rethrow_exception(cause_);
    }
    throw ContainerException(root_cause_, what());
}

}  // namespace sprout::di
