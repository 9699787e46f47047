#pragma once

/// @file skills.hpp
/// @brief Collaborator interfaces for skill levels, equipment and experience.
///
/// The combat core reads levels and bonuses through these interfaces and
/// reports experience through IExperienceSink; storage and progression
/// curves live with the host.

#include <cstdint>
#include <string_view>

#include "tcc/foundation/types.hpp"
#include "tcc/game/combat_types.hpp"

namespace tcc::game {

/// Skills consulted or trained by combat.
enum class SkillType : uint8_t {
    Attack,
    Strength,
    Defence,
    Hitpoints,
    Ranged,
    Magic,
    Beastmaster
};

constexpr std::string_view skillTypeName(SkillType skill) {
    switch (skill) {
        case SkillType::Attack:      return "Attack";
        case SkillType::Strength:    return "Strength";
        case SkillType::Defence:     return "Defence";
        case SkillType::Hitpoints:   return "Hitpoints";
        case SkillType::Ranged:      return "Ranged";
        case SkillType::Magic:       return "Magic";
        case SkillType::Beastmaster: return "Beastmaster";
    }
    return "Unknown";
}

/// Read access to an agent's current skill levels.
class ISkillSource {
public:
    virtual ~ISkillSource() = default;

    [[nodiscard]] virtual int32_t GetLevel(SkillType skill) const = 0;
};

/// Aggregated bonuses of everything an agent has equipped.
class IEquipmentSource {
public:
    virtual ~IEquipmentSource() = default;

    [[nodiscard]] virtual EquipmentBonus CombinedStats() const = 0;
};

/// Receives experience earned through combat.
class IExperienceSink {
public:
    virtual ~IExperienceSink() = default;

    virtual void AddExperience(foundation::AgentId agent, SkillType skill, float xp) = 0;
};

} // namespace tcc::game
