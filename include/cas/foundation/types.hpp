#pragma once

/// @file types.hpp
/// @brief Strong identifier types shared across the auth service.

#include <compare>
#include <functional>
#include <string>
#include <utility>

namespace cas::foundation {

/// Tag-based strong typedef for opaque identifiers.
///
/// Prevents passing a role id where a principal id is expected while
/// keeping the plain string representation used by stores and caches.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying value type.
template <typename Tag, typename T = std::string>
class StrongId {
public:
    StrongId() = default;
    explicit StrongId(T value) : value_(std::move(value)) {}

    [[nodiscard]] const T& value() const noexcept { return value_; }
    [[nodiscard]] bool isValid() const noexcept { return value_ != T{}; }

    auto operator<=>(const StrongId&) const = default;
    bool operator==(const StrongId&) const = default;

private:
    T value_{};
};

struct PrincipalIdTag {};
struct SessionIdTag {};
struct RoleIdTag {};
struct PermissionIdTag {};

/// Stable identifier of an authenticated actor.
using PrincipalId = StrongId<PrincipalIdTag>;

/// Opaque identifier of one server-side session record.
using SessionId = StrongId<SessionIdTag>;

/// Identifier of a role in the system of record.
using RoleId = StrongId<RoleIdTag>;

/// Identifier of a permission in the system of record.
using PermissionId = StrongId<PermissionIdTag>;

} // namespace cas::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<cas::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const cas::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
