/// @file poison_effect.cpp
/// @brief PoisonEffect countdown and OnHitPoisonApplier bookkeeping.

#include "tcc/game/poison_effect.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::game {

using foundation::AgentId;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

foundation::GameResult<void> PoisonSettings::Validate() const {
    auto invalid = [](const char* field) {
        return foundation::GameResult<void>::err(foundation::GameError(
            foundation::ErrorCode::InvalidArgument,
            std::string("poison: invalid ") + field, std::string(field)));
    };

    if (damagePerApplication < 1) return invalid("damagePerApplication");
    if (intervalTicks < 1) return invalid("intervalTicks");
    if (applications < 1) return invalid("applications");
    return foundation::GameResult<void>::ok();
}

// ═══════════════════════════════════════════════════════════════════════════
// PoisonEffect
// ═══════════════════════════════════════════════════════════════════════════

PoisonEffect::PoisonEffect(AgentId target,
                           const TargetRegistry& registry,
                           DamageSource source,
                           PoisonSettings settings)
    : target_(target),
      registry_(registry),
      source_(source),
      settings_(settings),
      remaining_(std::max(settings_.applications, 1)),
      countdown_(std::max(settings_.intervalTicks, 1)) {}

void PoisonEffect::Refresh(DamageSource source) {
    source_ = source;
    active_ = true;
    remaining_ = std::max(settings_.applications, 1);
    countdown_ = std::max(settings_.intervalTicks, 1);
}

void PoisonEffect::Cure() {
    if (active_) {
        Expire("cured");
    }
}

void PoisonEffect::OnTick() {
    if (!active_) {
        return;
    }

    CombatTarget* target = registry_.Find(target_);
    if (target == nullptr) {
        Expire("target lost");
        return;
    }
    if (!target->IsAlive()) {
        Expire("target died");
        return;
    }

    if (--countdown_ > 0) {
        return;
    }
    countdown_ = std::max(settings_.intervalTicks, 1);
    --remaining_;

    const int32_t applied =
        target->ApplyDamage(settings_.damagePerApplication, DamageType::Poison, source_);
    poisonTick_.emit(target_, applied);

    // A slot may have cured or refreshed the poison.
    if (active_ && remaining_ <= 0) {
        Expire("worn off");
    }
}

void PoisonEffect::Expire(const char* reason) {
    active_ = false;
    remaining_ = 0;
    countdown_ = 0;

    LogContext ctx;
    ctx.agentId = target_;
    ctx.extra["reason"] = reason;
    TCC_LOG_CTX(LogLevel::Debug, LogCategory::Combat, "poison ended", ctx);

    expired_.emit(target_);
}

// ═══════════════════════════════════════════════════════════════════════════
// OnHitPoisonApplier
// ═══════════════════════════════════════════════════════════════════════════

OnHitPoisonApplier::OnHitPoisonApplier(const TargetRegistry& registry,
                                       foundation::RandomSource& rng,
                                       PoisonSettings settings,
                                       float applyChance,
                                       bool requiresDamage)
    : registry_(registry),
      rng_(rng),
      settings_(settings),
      applyChance_(std::clamp(applyChance, 0.0f, 1.0f)),
      requiresDamage_(requiresDamage) {}

PoisonEffect* OnHitPoisonApplier::TryApply(const AttackEvent& event) {
    if (!event.outcome.hit || (requiresDamage_ && event.applied <= 0)) {
        return nullptr;
    }
    const CombatTarget* target = registry_.Find(event.target);
    if (target == nullptr || !target->IsAlive()) {
        return nullptr;
    }
    if (!(rng_.NextFloat(0.0f, 1.0f) < applyChance_)) {
        return nullptr;
    }

    DamageSource source{event.attacker, AgentKind::Npc};
    if (const CombatTarget* attacker = registry_.Find(event.attacker)) {
        source.kind = attacker->Kind();
    }

    LogContext ctx;
    ctx.agentId = event.attacker;
    ctx.targetId = event.target;

    if (PoisonEffect* existing = Find(event.target)) {
        existing->Refresh(source);
        TCC_LOG_CTX(LogLevel::Debug, LogCategory::Combat, "poison refreshed", ctx);
        return existing;
    }

    effects_.push_back(
        std::make_unique<PoisonEffect>(event.target, registry_, source, settings_));
    PoisonEffect& effect = *effects_.back();
    TCC_LOG_CTX(LogLevel::Debug, LogCategory::Combat, "poison applied", ctx);
    started_.emit(effect);
    return &effect;
}

AttackController::HitEffect OnHitPoisonApplier::AsHitEffect() {
    return [this](const AttackEvent& event) { TryApply(event); };
}

void OnHitPoisonApplier::Cure(AgentId target) {
    if (PoisonEffect* effect = Find(target)) {
        effect->Cure();
    }
}

void OnHitPoisonApplier::OnTick() {
    // Effects started by a slot during this loop wait for the next tick.
    const std::size_t count = effects_.size();
    for (std::size_t i = 0; i < count; ++i) {
        effects_[i]->OnTick();
    }
    effects_.erase(std::remove_if(effects_.begin(), effects_.end(),
                                  [](const std::unique_ptr<PoisonEffect>& effect) {
                                      return !effect->IsActive();
                                  }),
                   effects_.end());
}

PoisonEffect* OnHitPoisonApplier::Find(AgentId target) const {
    auto it = std::find_if(effects_.begin(), effects_.end(),
                           [target](const std::unique_ptr<PoisonEffect>& effect) {
                               return effect->Target() == target;
                           });
    return it != effects_.end() ? it->get() : nullptr;
}

bool OnHitPoisonApplier::IsPoisoned(AgentId target) const {
    const PoisonEffect* effect = Find(target);
    return effect != nullptr && effect->IsActive();
}

std::size_t OnHitPoisonApplier::ActiveCount() const {
    return static_cast<std::size_t>(
        std::count_if(effects_.begin(), effects_.end(),
                      [](const std::unique_ptr<PoisonEffect>& effect) { return effect->IsActive(); }));
}

} // namespace tcc::game
