#pragma once

/// @file health_pool.hpp
/// @brief Hit point holder with health-changed and death observers.

#include <cstdint>

#include "tcc/foundation/signal.hpp"
#include "tcc/foundation/types.hpp"
#include "tcc/game/combat_types.hpp"

namespace tcc::game {

/// Who dealt a hit.
struct DamageSource {
    foundation::AgentId attacker;
    AgentKind kind = AgentKind::Npc;
};

/// Emitted after every HP change, including respawn restores.
struct HealthChangedEvent {
    foundation::AgentId agent;
    int32_t previousHp = 0;
    int32_t currentHp = 0;
    int32_t maxHp = 0;
    /// currentHp - previousHp; negative for damage.
    int32_t delta = 0;
    DamageType damageType = DamageType::Melee;
    DamageSource source;
};

/// Emitted once per life, after the HealthChangedEvent of the killing blow.
struct DeathEvent {
    foundation::AgentId agent;
    DamageSource killer;
    DamageType damageType = DamageType::Melee;
    /// 1 for the first life, incremented by Restore().
    uint32_t life = 1;
};

/// Current and maximum HP of one agent plus its observer lists.
///
/// ApplyDamage() is the only way HP goes down. Observers connect to
/// OnHealthChanged()/OnDeath() and should keep the returned
/// ScopedConnection for as long as they live.
class HealthPool {
public:
    HealthPool(foundation::AgentId owner, int32_t maxHp);

    HealthPool(const HealthPool&) = delete;
    HealthPool& operator=(const HealthPool&) = delete;

    [[nodiscard]] int32_t Current() const noexcept { return current_; }
    [[nodiscard]] int32_t Max() const noexcept { return max_; }
    [[nodiscard]] bool IsAlive() const noexcept { return current_ > 0; }
    [[nodiscard]] uint32_t Life() const noexcept { return life_; }

    /// Subtract up to @p amount HP, never below zero.
    ///
    /// Emits the health-changed event when HP changed, then the death event
    /// when this hit took HP from positive to zero. Dead pools and
    /// non-positive amounts apply nothing and emit nothing.
    /// @return HP actually removed.
    int32_t ApplyDamage(int32_t amount, DamageType type, const DamageSource& source);

    /// Refill to max HP and start a new life (respawn).
    void Restore();

    /// Change max HP, clamping current HP into the new range.
    void SetMax(int32_t maxHp);

    [[nodiscard]] foundation::Signal<const HealthChangedEvent&>& OnHealthChanged() noexcept {
        return healthChanged_;
    }
    [[nodiscard]] foundation::Signal<const DeathEvent&>& OnDeath() noexcept { return death_; }

private:
    foundation::AgentId owner_;
    int32_t max_;
    int32_t current_;
    uint32_t life_ = 1;

    foundation::Signal<const HealthChangedEvent&> healthChanged_;
    foundation::Signal<const DeathEvent&> death_;
};

} // namespace tcc::game
