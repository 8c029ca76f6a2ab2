#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "sprout/di/type_ref.hpp"

namespace sprout::di {

/**
 * @brief Failure categories raised by the container
 */
enum class ErrorCode {
    INVALID_ARGUMENT,       // A required input is absent
    NOT_FOUND,              // No registry entry for (type, qualifier)
    AMBIGUOUS_CONSTRUCTOR,  // More than one constructor marked for injection
    NO_VIABLE_CONSTRUCTOR,  // Nothing marked and no zero-argument constructor
    CYCLIC_DEPENDENCY,      // A construction chain revisits a type
    INVALID_TARGET,         // Injection point violates structural rules
    INSTANTIATION_FAILED    // Wrapper raised when construction fails
};

const char* to_string(ErrorCode code);

/**
 * @brief Base class of every exception thrown by the container
 */
class ContainerException : public std::runtime_error {
public:
    ContainerException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class InvalidArgumentException : public ContainerException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : ContainerException(ErrorCode::INVALID_ARGUMENT, message) {}
};

class BeanNotFoundException : public ContainerException {
public:
    BeanNotFoundException(TypeRef type, const std::string& qualifier,
                          bool type_known);

    TypeRef type() const noexcept { return type_; }
    const std::string& qualifier() const noexcept { return qualifier_; }

private:
    TypeRef type_;
    std::string qualifier_;
};

/**
 * @brief Structural defect in a component's declared constructors
 */
class ConstructorSelectionException : public ContainerException {
public:
    ConstructorSelectionException(ErrorCode code, TypeRef type,
                                  const std::string& message)
        : ContainerException(code, message), type_(type) {}

    TypeRef type() const noexcept { return type_; }

private:
    TypeRef type_;
};

class AmbiguousConstructorException : public ConstructorSelectionException {
public:
    AmbiguousConstructorException(TypeRef type, std::size_t marked_count);
};

class NoViableConstructorException : public ConstructorSelectionException {
public:
    explicit NoViableConstructorException(TypeRef type);
};

class CyclicDependencyException : public ContainerException {
public:
    CyclicDependencyException(TypeRef type, std::vector<TypeRef> chain);

    TypeRef type() const noexcept { return type_; }
    // Types under construction when the cycle was found, outermost first
    const std::vector<TypeRef>& chain() const noexcept { return chain_; }

private:
    TypeRef type_;
    std::vector<TypeRef> chain_;
};

class InvalidTargetException : public ContainerException {
public:
    InvalidTargetException(TypeRef owner, const std::string& member,
                           const std::string& reason);

    TypeRef owner() const noexcept { return owner_; }
    const std::string& member() const noexcept { return member_; }

private:
    TypeRef owner_;
    std::string member_;
};

/**
 * @brief Wraps any failure escaping bean construction
 *
 * Carries the type whose construction failed, the category of the original
 * failure and the original exception itself.
 */
class BeanInstantiationException : public ContainerException {
public:
    BeanInstantiationException(TypeRef type, std::exception_ptr cause);

    TypeRef bean_type() const noexcept { return bean_type_; }
    ErrorCode root_cause() const noexcept { return root_cause_; }
    std::exception_ptr cause() const noexcept { return cause_; }

    // Rethrows the wrapped exception
    [[noreturn]] void rethrow_cause() const;

private:
    TypeRef bean_type_;
    ErrorCode root_cause_;
    std::exception_ptr cause_;
};

}  // namespace sprout::di
