#pragma once

/// @file types.hpp
/// @brief Strong id types shared across the combat core.

#include <cstdint>
#include <functional>

namespace tcc::foundation {

/// Tag-based strong typedef for id values.
///
/// Keeps agent ids from mixing with other integral ids at compile time.
///
/// @tparam Tag A unique tag type.
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

struct AgentIdTag {};

/// Identifier of a simulated agent (player, NPC or pet). Zero is invalid.
using AgentId = StrongId<AgentIdTag>;

/// Invalid/null sentinel for any id type.
template <typename Tag, typename T>
constexpr StrongId<Tag, T> NULL_ID{};

} // namespace tcc::foundation

template <typename Tag, typename T>
struct std::hash<tcc::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const tcc::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
