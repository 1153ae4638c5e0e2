#pragma once

/// @file types.hpp
/// @brief Strong ID types shared across gateway components.

#include <cstdint>
#include <functional>

namespace agw::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct OverrideIdTag {};
struct LeaseIdTag {};

/// Identifier of an emergency override record.
using OverrideId = StrongId<OverrideIdTag>;

/// Identifier of an upstream concurrency lease (the HTTP "ticket").
using LeaseId = StrongId<LeaseIdTag>;

} // namespace agw::foundation

template <typename Tag, typename T>
struct std::hash<agw::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const agw::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
