#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "sprout/di/bean_registry.hpp"
#include "sprout/di/exceptions.hpp"
#include "sprout/di/type_ref.hpp"

namespace sprout::di {

/**
 * @brief Where a dependency enters a component
 */
enum class InjectionPointKind { CONSTRUCTOR, FIELD, SETTER };

const char* to_string(InjectionPointKind kind);

/**
 * @brief A single dependency: its declared type and optional qualifier
 */
struct InjectionPoint {
    InjectionPointKind kind = InjectionPointKind::CONSTRUCTOR;
    TypeRef type;
    std::optional<std::string> qualifier;

    // Qualifier to use against the registry
    std::string registry_qualifier() const {
        return qualifier.value_or(DEFAULT_QUALIFIER);
    }
};

struct ConstructorDescriptor {
    bool inject = false;  // marked for injection
    std::vector<InjectionPoint> parameters;
    // Builds the implementation object from resolved parameters
    std::function<Instance(const std::vector<Instance>&)> invoker;
};

// Describes a field marked for injection
struct FieldDescriptor {
    std::string name;
    bool immutable = false;
    bool is_static = false;
    InjectionPoint point;
    // Empty for immutable and static fields
    std::function<void(const Instance& target, const Instance& value)> assign;
};

// Describes a method marked for injection
struct MethodDescriptor {
    std::string name;
    bool is_static = false;
    std::size_t arity = 0;
    // Filled only for single-parameter methods
    std::vector<InjectionPoint> parameters;
    // Empty unless the method is a non-static single-parameter method
    std::function<void(const Instance& target,
                       const std::vector<Instance>& args)>
        invoke;
};

/**
 * @brief Construction and injection metadata of one component type
 *
 * type() is the key the component is registered under; implementation() is
 * the class that is actually constructed. They differ when an implementation
 * is exposed through an interface.
 */
class ComponentDescriptor {
public:
    ComponentDescriptor(TypeRef type, TypeRef implementation,
                        std::vector<ConstructorDescriptor> constructors,
                        std::vector<FieldDescriptor> fields,
                        std::vector<MethodDescriptor> methods,
                        std::function<Instance(const Instance&)> expose);

    TypeRef type() const { return type_; }
    TypeRef implementation() const { return implementation_; }

    const std::vector<ConstructorDescriptor>& constructors() const {
        return constructors_;
    }
    const std::vector<FieldDescriptor>& fields() const { return fields_; }
    const std::vector<MethodDescriptor>& methods() const { return methods_; }

    // Converts an implementation object into a pointer to type()
    Instance expose(const Instance& object) const { return expose_(object); }

private:
    TypeRef type_;
    TypeRef implementation_;
    std::vector<ConstructorDescriptor> constructors_;
    std::vector<FieldDescriptor> fields_;
    std::vector<MethodDescriptor> methods_;
    std::function<Instance(const Instance&)> expose_;
};

/**
 * @brief Grants the container access to non-public constructors
 *
 * A component with private constructors declares
 * `friend class sprout::di::ConstructorAccess;`.
 */
class ConstructorAccess {
public:
    template <typename T, typename... Args>
    static std::shared_ptr<T> create(Args&&... args) {
        return std::shared_ptr<T>(new T(std::forward<Args>(args)...));
    }
};

namespace detail {

template <typename P>
struct dependency_of {
    static_assert(sizeof(P) == 0,
                  "injection points must be std::shared_ptr<Dependency>");
};

template <typename D>
struct dependency_of<std::shared_ptr<D>> {
    using type = std::remove_cv_t<D>;
};

template <typename P>
using dependency_of_t = typename dependency_of<std::remove_cvref_t<P>>::type;

}  // namespace detail

/**
 * @brief Collects the injection metadata of a component type T
 *
 * @example
 * ```cpp
 * static void describe(sprout::di::ComponentDescriptorBuilder<ShapeService>& b) {
 *     b.inject_constructor<Shape, Rectangle>({"circle"})
 *      .inject_field("palette_", &ShapeService::palette_)
 *      .inject_method("setCanvas", &ShapeService::setCanvas);
 * }
 * ```
 */
template <typename T>
class ComponentDescriptorBuilder {
public:
    using Qualifiers = std::vector<std::optional<std::string>>;

    ComponentDescriptorBuilder()
        : key_type_(TypeRef::of<T>()),
          expose_([](const Instance& object) { return object; }) {}

    /**
     * @brief Declare a constructor marked for injection
     * @tparam Deps dependency types, in parameter order; the constructor
     *         receives std::shared_ptr<Deps>...
     * @param qualifiers per-parameter qualifiers, shorter lists leave the
     *        remaining parameters unqualified
     */
    template <typename... Deps>
    ComponentDescriptorBuilder& inject_constructor(Qualifiers qualifiers = {}) {
        return add_constructor<Deps...>(true, std::move(qualifiers));
    }

    // Declare a constructor that is not marked for injection
    template <typename... Deps>
    ComponentDescriptorBuilder& constructor(Qualifiers qualifiers = {}) {
        return add_constructor<Deps...>(false, std::move(qualifiers));
    }

    /**
     * @brief Mark a data member for field injection
     *
     * Const members are recorded as immutable; the container rejects them
     * when it constructs the component.
     */
    template <typename M, typename C>
    ComponentDescriptorBuilder& inject_field(
        std::string name, M C::*member,
        std::optional<std::string> qualifier = std::nullopt) {
        static_assert(!std::is_function_v<M>,
                      "use inject_method for member functions");
        static_assert(std::is_base_of_v<C, T>,
                      "field must be a member of the component");
        using Dep = detail::dependency_of_t<M>;

        FieldDescriptor field;
        field.name = std::move(name);
        field.immutable = std::is_const_v<M>;
        field.point = InjectionPoint{InjectionPointKind::FIELD,
                                     TypeRef::of<Dep>(), std::move(qualifier)};
        if constexpr (!std::is_const_v<M>) {
            field.assign = [member](const Instance& target,
                                    const Instance& value) {
                static_cast<T*>(target.get())->*member =
                    std::static_pointer_cast<Dep>(value);
            };
        }
        fields_.push_back(std::move(field));
        return *this;
    }

    // Mark a static data member for field injection (always rejected)
    template <typename M>
    ComponentDescriptorBuilder& inject_field(
        std::string name, [[maybe_unused]] M* static_member,
        std::optional<std::string> qualifier = std::nullopt) {
        static_assert(!std::is_function_v<M>,
                      "use inject_method for functions");
        using Dep = detail::dependency_of_t<M>;

        FieldDescriptor field;
        field.name = std::move(name);
        field.immutable = std::is_const_v<M>;
        field.is_static = true;
        field.point = InjectionPoint{InjectionPointKind::FIELD,
                                     TypeRef::of<Dep>(), std::move(qualifier)};
        fields_.push_back(std::move(field));
        return *this;
    }

    /**
     * @brief Mark a member function for setter injection
     *
     * Only single-parameter methods whose name starts with "set" are
     * invoked by the container.
     */
    template <typename R, typename C, typename... Args>
    ComponentDescriptorBuilder& inject_method(
        std::string name, R (C::*method)(Args...),
        std::optional<std::string> qualifier = std::nullopt) {
        static_assert(std::is_base_of_v<C, T>,
                      "method must be a member of the component");

        MethodDescriptor descriptor;
        descriptor.name = std::move(name);
        descriptor.arity = sizeof...(Args);
        if constexpr (sizeof...(Args) == 1) {
            using Dep = detail::dependency_of_t<
                std::tuple_element_t<0, std::tuple<Args...>>>;
            descriptor.parameters.push_back(
                InjectionPoint{InjectionPointKind::SETTER, TypeRef::of<Dep>(),
                               std::move(qualifier)});
            descriptor.invoke = [method](const Instance& target,
                                         const std::vector<Instance>& args) {
                (static_cast<T*>(target.get())->*method)(
                    std::static_pointer_cast<Dep>(args.at(0)));
            };
        }
        methods_.push_back(std::move(descriptor));
        return *this;
    }

    // Mark a static member function for setter injection (never invoked)
    template <typename R, typename... Args>
    ComponentDescriptorBuilder& inject_method(
        std::string name, [[maybe_unused]] R (*function)(Args...),
        std::optional<std::string> qualifier = std::nullopt) {
        MethodDescriptor descriptor;
        descriptor.name = std::move(name);
        descriptor.arity = sizeof...(Args);
        descriptor.is_static = true;
        if constexpr (sizeof...(Args) == 1) {
            using Dep = detail::dependency_of_t<
                std::tuple_element_t<0, std::tuple<Args...>>>;
            descriptor.parameters.push_back(
                InjectionPoint{InjectionPointKind::SETTER, TypeRef::of<Dep>(),
                               std::move(qualifier)});
        }
        methods_.push_back(std::move(descriptor));
        return *this;
    }

    // Register the component under an interface instead of T itself
    template <typename Key>
    ComponentDescriptorBuilder& expose_as() {
        static_assert(std::is_same_v<Key, T> || std::is_base_of_v<Key, T>,
                      "T must derive from Key");
        key_type_ = TypeRef::of<Key>();
        expose_ = [](const Instance& object) -> Instance {
            std::shared_ptr<Key> key = std::static_pointer_cast<T>(object);
            return key;
        };
        return *this;
    }

    std::shared_ptr<const ComponentDescriptor> build() const {
        auto constructors = constructors_;
        if constexpr (std::is_default_constructible_v<T>) {
            if (!has_zero_arg_constructor_) {
                ConstructorDescriptor implicit;
                implicit.invoker = [](const std::vector<Instance>&) -> Instance {
                    return ConstructorAccess::create<T>();
                };
                constructors.push_back(std::move(implicit));
            }
        }
        return std::make_shared<const ComponentDescriptor>(
            key_type_, TypeRef::of<T>(), std::move(constructors), fields_,
            methods_, expose_);
    }

private:
    template <typename... Deps>
    ComponentDescriptorBuilder& add_constructor(bool inject,
                                                Qualifiers qualifiers) {
        if (qualifiers.size() > sizeof...(Deps)) {
            throw InvalidArgumentException(
                "More qualifiers than constructor parameters for " +
                TypeRef::of<T>().name());
        }
        qualifiers.resize(sizeof...(Deps));

        ConstructorDescriptor ctor;
        ctor.inject = inject;
        std::size_t index = 0;
        (ctor.parameters.push_back(
             InjectionPoint{InjectionPointKind::CONSTRUCTOR,
                            TypeRef::of<std::remove_cv_t<Deps>>(),
                            std::move(qualifiers[index++])}),
         ...);
        ctor.invoker = [](const std::vector<Instance>& args) -> Instance {
            return construct<Deps...>(args, std::index_sequence_for<Deps...>{});
        };

        if constexpr (sizeof...(Deps) == 0) {
            has_zero_arg_constructor_ = true;
        }
        constructors_.push_back(std::move(ctor));
        return *this;
    }

    template <typename... Deps, std::size_t... I>
    static Instance construct([[maybe_unused]] const std::vector<Instance>& args,
                              std::index_sequence<I...>) {
        return ConstructorAccess::create<T>(
            std::static_pointer_cast<std::remove_cv_t<Deps>>(args.at(I))...);
    }

    TypeRef key_type_;
    std::function<Instance(const Instance&)> expose_;
    std::vector<ConstructorDescriptor> constructors_;
    std::vector<FieldDescriptor> fields_;
    std::vector<MethodDescriptor> methods_;
    bool has_zero_arg_constructor_ = false;
};

/**
 * @brief Builds the descriptor of T, exposed as Key
 *
 * Uses `static void T::describe(ComponentDescriptorBuilder<T>&)` when T
 * provides one.
 */
template <typename T, typename Key = T>
std::shared_ptr<const ComponentDescriptor> describe_component() {
    ComponentDescriptorBuilder<T> builder;
    if constexpr (requires(ComponentDescriptorBuilder<T>& b) {
                      T::describe(b);
                  }) {
        T::describe(builder);
    }
    if constexpr (!std::is_same_v<Key, T>) {
        builder.template expose_as<Key>();
    }
    return builder.build();
}

}  // namespace sprout::di
