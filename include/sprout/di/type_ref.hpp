#pragma once

#include <boost/core/demangle.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace sprout::di {

/**
 * @brief Nullable handle on a C++ type
 *
 * Wraps a std::type_info pointer so that "no type" can be expressed and
 * rejected at the container boundary. Two refs compare equal iff they name
 * exactly the same type.
 */
class TypeRef {
public:
    TypeRef() = default;
    explicit TypeRef(const std::type_info& info) : info_(&info) {}

    template <typename T>
    static TypeRef of() {
        return TypeRef(typeid(T));
    }

    bool empty() const noexcept { return info_ == nullptr; }
    explicit operator bool() const noexcept { return info_ != nullptr; }

    std::type_index index() const { return std::type_index(*info_); }

    // Human-readable type name, "<none>" for an empty ref
    std::string name() const {
        return info_ ? boost::core::demangle(info_->name()) : "<none>";
    }

    friend bool operator==(const TypeRef& lhs, const TypeRef& rhs) noexcept {
        if (lhs.info_ == rhs.info_) return true;
        if (!lhs.info_ || !rhs.info_) return false;
        return *lhs.info_ == *rhs.info_;
    }

    friend bool operator!=(const TypeRef& lhs, const TypeRef& rhs) noexcept {
        return !(lhs == rhs);
    }

    std::size_t hash_code() const noexcept {
        return info_ ? info_->hash_code() : 0;
    }

private:
    const std::type_info* info_ = nullptr;
};

}  // namespace sprout::di

template <>
struct std::hash<sprout::di::TypeRef> {
    std::size_t operator()(const sprout::di::TypeRef& ref) const noexcept {
        return ref.hash_code();
    }
};
