#pragma once

/// @file player_combatant.hpp
/// @brief CombatTarget adapter for the player.

#include "tcc/game/combat_target.hpp"
#include "tcc/game/skills.hpp"

namespace tcc::game {

/// The player's combat state.
///
/// Levels and bonuses are read live from the host's skill and equipment
/// sources on every snapshot. The selected style applies to both attack and
/// defence snapshots. Position is pushed in by the host's mover.
class PlayerCombatant final : public CombatTarget {
public:
    /// Max HP is the Hitpoints level, or 10 without a skill source.
    PlayerCombatant(foundation::AgentId id,
                    const ISkillSource* skills,
                    const IEquipmentSource* equipment);

    [[nodiscard]] foundation::AgentId Id() const override { return id_; }
    [[nodiscard]] AgentKind Kind() const override { return AgentKind::Player; }
    [[nodiscard]] Vector2 Position() const override { return position_; }
    [[nodiscard]] bool IsAlive() const override { return health_.IsAlive(); }
    [[nodiscard]] int32_t CurrentHP() const override { return health_.Current(); }
    [[nodiscard]] int32_t MaxHP() const override { return health_.Max(); }
    [[nodiscard]] DamageType PreferredDefenceType() const override { return defenceType_; }
    [[nodiscard]] CombatantStats DefenderStats(DamageType incoming) const override;
    int32_t ApplyDamage(int32_t amount, DamageType type, const DamageSource& source) override;
    [[nodiscard]] HealthPool& Health() override { return health_; }
    [[nodiscard]] IGuardResponder* GuardResponder() const override;

    /// Snapshot used when the player attacks.
    [[nodiscard]] CombatantStats AttackerStats() const;

    void SetPosition(const Vector2& position) noexcept { position_ = position; }

    void SetStyle(CombatStyle style) noexcept { style_ = style; }
    [[nodiscard]] CombatStyle Style() const noexcept { return style_; }

    void SetAttackType(DamageType type) noexcept { attackType_ = type; }
    [[nodiscard]] DamageType AttackType() const noexcept { return attackType_; }

    void SetPreferredDefenceType(DamageType type) noexcept { defenceType_ = type; }

    /// Pet that defends the player while guard mode is on.
    void SetGuardPet(IGuardResponder* pet) noexcept { guardPet_ = pet; }
    /// Assigned guard pet, whether or not guard mode is on.
    [[nodiscard]] IGuardResponder* GuardPet() const noexcept { return guardPet_; }
    void SetGuardMode(bool enabled) noexcept { guardMode_ = enabled; }
    [[nodiscard]] bool GuardModeEnabled() const noexcept { return guardMode_; }

private:
    foundation::AgentId id_;
    const ISkillSource* skills_;
    const IEquipmentSource* equipment_;
    HealthPool health_;
    Vector2 position_;
    CombatStyle style_ = CombatStyle::Accurate;
    DamageType attackType_ = DamageType::Melee;
    DamageType defenceType_ = DamageType::Melee;
    IGuardResponder* guardPet_ = nullptr;
    bool guardMode_ = false;
};

} // namespace tcc::game
