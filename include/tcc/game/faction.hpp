#pragma once

/// @file faction.hpp
/// @brief NPC faction ids and the hostility table between them.

#include <cstdint>
#include <set>
#include <utility>

namespace tcc::game {

using FactionId = uint16_t;

/// Faction that is hostile to nobody.
constexpr FactionId kNeutralFaction = 0;

/// Symmetric hostility relation between NPC factions.
///
/// Aggressive NPCs also engage NPCs of a hostile faction. The neutral
/// faction can never be made hostile, and a faction is never hostile to
/// itself.
class FactionTable {
public:
    /// Mark @p a and @p b hostile (or not) to each other.
    /// Requests involving the neutral faction or a single faction are ignored.
    void SetHostile(FactionId a, FactionId b, bool hostile = true);

    [[nodiscard]] bool IsHostile(FactionId a, FactionId b) const;

    [[nodiscard]] std::size_t PairCount() const noexcept { return pairs_.size(); }

private:
    static std::pair<FactionId, FactionId> Key(FactionId a, FactionId b) noexcept {
        return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
    }

    std::set<std::pair<FactionId, FactionId>> pairs_;
};

} // namespace tcc::game
