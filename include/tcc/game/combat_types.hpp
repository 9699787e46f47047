#pragma once

/// @file combat_types.hpp
/// @brief Enumerations, bonus tables and constants for combat resolution.

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tcc::game {

/// Default real-time length of one simulation tick, in seconds.
constexpr float kTickSeconds = 0.6f;

/// Maximum distance (tiles) at which a melee attack can be resolved.
constexpr float kMeleeRange = 1.5f;

/// Attack cadence used when a profile or item does not specify one.
constexpr int32_t kDefaultAttackSpeedTicks = 4;

/// Flat bonus the primary style adds to its effective level.
constexpr int32_t kStyleBonus = 3;

/// Flat bonus Controlled adds to each effective level.
constexpr int32_t kControlledStyleBonus = 1;

/// Offset added to equipment bonuses in attack/defence rolls and max hit.
constexpr int32_t kRollBonusOffset = 64;

/// Divisor of the max-hit formula.
constexpr int32_t kMaxHitDivisor = 640;

/// Combat style selected by the attacker or defender.
enum class CombatStyle : uint8_t {
    Accurate,   ///< Boosts effective attack.
    Aggressive, ///< Boosts effective strength.
    Defensive,  ///< Boosts effective defence.
    Controlled  ///< Small boost to all three.
};

/// How damage is delivered; selects which bonuses apply.
enum class DamageType : uint8_t {
    Melee,
    Ranged,
    Magic,
    Burn,
    Poison
};

/// Number of distinct damage types (for array sizing).
constexpr std::size_t kDamageTypeCount = 5;

constexpr std::string_view damageTypeName(DamageType type) {
    switch (type) {
        case DamageType::Melee:  return "Melee";
        case DamageType::Ranged: return "Ranged";
        case DamageType::Magic:  return "Magic";
        case DamageType::Burn:   return "Burn";
        case DamageType::Poison: return "Poison";
    }
    return "Unknown";
}

constexpr std::string_view combatStyleName(CombatStyle style) {
    switch (style) {
        case CombatStyle::Accurate:   return "Accurate";
        case CombatStyle::Aggressive: return "Aggressive";
        case CombatStyle::Defensive:  return "Defensive";
        case CombatStyle::Controlled: return "Controlled";
    }
    return "Unknown";
}

/// Aggregated equipment bonuses of one combatant.
struct EquipmentBonus {
    int32_t attack = 0;
    int32_t strength = 0;
    int32_t range = 0;
    int32_t magic = 0;
    int32_t meleeDefence = 0;
    int32_t rangeDefence = 0;
    int32_t magicDefence = 0;
    int32_t attackSpeedTicks = kDefaultAttackSpeedTicks;

    /// Accuracy bonus used when attacking with @p type.
    [[nodiscard]] constexpr int32_t AccuracyBonusFor(DamageType type) const noexcept {
        switch (type) {
            case DamageType::Magic:  return magic;
            case DamageType::Ranged: return range;
            default:                 return attack;
        }
    }

    /// Defence bonus applied against incoming damage of @p type.
    [[nodiscard]] constexpr int32_t DefenceBonusFor(DamageType type) const noexcept {
        switch (type) {
            case DamageType::Magic:  return magicDefence;
            case DamageType::Ranged: return rangeDefence;
            default:                 return meleeDefence;
        }
    }

    constexpr bool operator==(const EquipmentBonus&) const = default;
};

/// Direction index consumed by sprite layers.
enum class FacingDirection : uint8_t {
    Down  = 0,
    Left  = 1,
    Right = 2,
    Up    = 3
};

/// Kind of agent behind a combat target.
enum class AgentKind : uint8_t {
    Player,
    Npc,
    Pet
};

} // namespace tcc::game
