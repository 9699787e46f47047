#pragma once

/// @file pet_combatant.hpp
/// @brief CombatTarget adapter for pets.

#include "tcc/game/combat_target.hpp"
#include "tcc/game/pet_definition.hpp"
#include "tcc/game/skills.hpp"

namespace tcc::game {

class PetProgression;

/// Combat state of a pet. Stats scale with the pet's own level and with
/// its owner's Beastmaster level, both read at snapshot time.
class PetCombatant final : public CombatTarget {
public:
    /// @param ownerSkills  Owner's skills for Beastmaster scaling; may be null.
    /// @param progression  Pet level tracker; null means full-strength stats.
    PetCombatant(foundation::AgentId id,
                 foundation::AgentId owner,
                 PetDefinition definition,
                 const ISkillSource* ownerSkills,
                 const PetProgression* progression);

    [[nodiscard]] foundation::AgentId Id() const override { return id_; }
    [[nodiscard]] AgentKind Kind() const override { return AgentKind::Pet; }
    [[nodiscard]] Vector2 Position() const override { return position_; }
    [[nodiscard]] bool IsAlive() const override;
    [[nodiscard]] int32_t CurrentHP() const override { return health_.Current(); }
    [[nodiscard]] int32_t MaxHP() const override { return health_.Max(); }
    [[nodiscard]] DamageType PreferredDefenceType() const override { return DamageType::Melee; }
    [[nodiscard]] CombatantStats DefenderStats(DamageType incoming) const override;
    int32_t ApplyDamage(int32_t amount, DamageType type, const DamageSource& source) override;
    [[nodiscard]] HealthPool& Health() override { return health_; }

    [[nodiscard]] CombatantStats AttackerStats() const;

    [[nodiscard]] foundation::AgentId Owner() const noexcept { return owner_; }
    [[nodiscard]] const PetDefinition& Definition() const noexcept { return definition_; }
    [[nodiscard]] bool CanFight() const noexcept { return definition_.canFight; }

    void SetPosition(const Vector2& position) noexcept { position_ = position; }

private:
    foundation::AgentId id_;
    foundation::AgentId owner_;
    PetDefinition definition_;
    const ISkillSource* ownerSkills_;
    const PetProgression* progression_;
    HealthPool health_;
    Vector2 position_;
};

} // namespace tcc::game
