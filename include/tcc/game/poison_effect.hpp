#pragma once

/// @file poison_effect.hpp
/// @brief Poison: periodic damage over time started by landed hits.
///
/// A PoisonEffect damages one target every few ticks and expires after a
/// fixed number of applications. OnHitPoisonApplier owns the effects it
/// starts and is plugged into an AttackController as its on-hit effect.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "tcc/core/tickable.hpp"
#include "tcc/foundation/game_result.hpp"
#include "tcc/foundation/random_source.hpp"
#include "tcc/foundation/signal.hpp"
#include "tcc/foundation/types.hpp"
#include "tcc/game/attack_controller.hpp"
#include "tcc/game/health_pool.hpp"
#include "tcc/game/target_registry.hpp"

namespace tcc::game {

/// Strength and cadence of a poison.
struct PoisonSettings {
    /// HP removed by each application.
    int32_t damagePerApplication = 4;

    /// Ticks between applications; the first one lands a full interval
    /// after the poison starts.
    int32_t intervalTicks = 25;

    /// Applications before the poison wears off.
    int32_t applications = 5;

    /// @return Success or InvalidArgument naming the first bad field.
    [[nodiscard]] foundation::GameResult<void> Validate() const;
};

/// Poison on one target.
///
/// The target is looked up by id on every tick, so a despawned target
/// simply ends the poison. A dead target ends it as well.
class PoisonEffect final : public ITickable {
public:
    PoisonEffect(foundation::AgentId target,
                 const TargetRegistry& registry,
                 DamageSource source,
                 PoisonSettings settings);

    PoisonEffect(const PoisonEffect&) = delete;
    PoisonEffect& operator=(const PoisonEffect&) = delete;

    /// Restart the countdown and the application count, reactivating an
    /// expired poison.
    void Refresh(DamageSource source);

    /// End the poison now; emits OnExpired() if it was active.
    void Cure();

    void OnTick() override;

    [[nodiscard]] bool IsActive() const noexcept { return active_; }
    [[nodiscard]] foundation::AgentId Target() const noexcept { return target_; }
    [[nodiscard]] int32_t ApplicationsRemaining() const noexcept { return remaining_; }
    [[nodiscard]] int32_t TicksUntilNextApplication() const noexcept { return countdown_; }
    [[nodiscard]] const PoisonSettings& Settings() const noexcept { return settings_; }

    /// Target id and HP actually removed, after every application.
    [[nodiscard]] foundation::Signal<foundation::AgentId, int32_t>& OnPoisonTick() noexcept {
        return poisonTick_;
    }
    [[nodiscard]] foundation::Signal<foundation::AgentId>& OnExpired() noexcept { return expired_; }

private:
    void Expire(const char* reason);

    foundation::AgentId target_;
    const TargetRegistry& registry_;
    DamageSource source_;
    PoisonSettings settings_;

    bool active_ = true;
    int32_t remaining_ = 0;
    int32_t countdown_ = 0;

    foundation::Signal<foundation::AgentId, int32_t> poisonTick_;
    foundation::Signal<foundation::AgentId> expired_;
};

/// Starts poison on the targets of landed hits, with a fixed chance.
///
/// One effect per target: hitting an already poisoned target refreshes
/// its poison instead of stacking a second one. Expired effects are
/// dropped at the end of the tick they expire in.
class OnHitPoisonApplier final : public ITickable {
public:
    OnHitPoisonApplier(const TargetRegistry& registry,
                       foundation::RandomSource& rng,
                       PoisonSettings settings,
                       float applyChance = 0.25f,
                       bool requiresDamage = true);

    OnHitPoisonApplier(const OnHitPoisonApplier&) = delete;
    OnHitPoisonApplier& operator=(const OnHitPoisonApplier&) = delete;

    /// Roll for poison on the target of @p event.
    /// @return The started or refreshed effect, or null when nothing applied.
    PoisonEffect* TryApply(const AttackEvent& event);

    /// Callback for AttackController::SetOnHitEffect().
    [[nodiscard]] AttackController::HitEffect AsHitEffect();

    /// Cure the poison on @p target, if any.
    void Cure(foundation::AgentId target);

    /// Tick every effect, then drop the expired ones.
    void OnTick() override;

    [[nodiscard]] PoisonEffect* Find(foundation::AgentId target) const;
    [[nodiscard]] bool IsPoisoned(foundation::AgentId target) const;
    [[nodiscard]] std::size_t ActiveCount() const;

    /// Fired when an effect is started (not refreshed).
    [[nodiscard]] foundation::Signal<PoisonEffect&>& OnPoisonStarted() noexcept { return started_; }

private:
    const TargetRegistry& registry_;
    foundation::RandomSource& rng_;
    PoisonSettings settings_;
    float applyChance_;
    bool requiresDamage_;

    std::vector<std::unique_ptr<PoisonEffect>> effects_;
    foundation::Signal<PoisonEffect&> started_;
};

} // namespace tcc::game
