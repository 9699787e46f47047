#pragma once

/// @file attack_controller.hpp
/// @brief AttackController: one agent's attack session and cadence.
///
/// A session is a target id plus a cooldown counted in ticks. The controller
/// never blocks: OnTick() either resolves one attack, counts the cooldown
/// down, or ends the session. Waiting is only the counter being non-zero.

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

#include "tcc/foundation/signal.hpp"
#include "tcc/foundation/types.hpp"
#include "tcc/game/combat_resolver.hpp"
#include "tcc/game/combat_target.hpp"
#include "tcc/game/target_registry.hpp"

namespace tcc::game {

/// Answer to an attack command.
enum class EngageResult : uint8_t {
    Started,        ///< A new session began (any previous one was superseded).
    AlreadyEngaged, ///< Already attacking this target; nothing changed.
    Declined        ///< Target missing, dead, self, or attacker unable to fight.
};

/// Why a session ended.
enum class SessionEndReason : uint8_t {
    Cancelled,    ///< Explicit cancel.
    Superseded,   ///< Replaced by a session against another target.
    TargetDied,
    TargetLost,   ///< Target no longer registered.
    OutOfRange,   ///< Target beyond the leash distance.
    Leashed,      ///< Owner pulled the agent back (aggro radius exceeded).
    AttackerDied
};

constexpr std::string_view sessionEndReasonName(SessionEndReason reason) {
    switch (reason) {
        case SessionEndReason::Cancelled:    return "Cancelled";
        case SessionEndReason::Superseded:   return "Superseded";
        case SessionEndReason::TargetDied:   return "TargetDied";
        case SessionEndReason::TargetLost:   return "TargetLost";
        case SessionEndReason::OutOfRange:   return "OutOfRange";
        case SessionEndReason::Leashed:      return "Leashed";
        case SessionEndReason::AttackerDied: return "AttackerDied";
    }
    return "Unknown";
}

/// The live engagement of one attacker.
struct AttackSession {
    foundation::AgentId target;
    int32_t cooldownRemainingTicks = 0;
    /// The guard responder of the target has been alerted in this session.
    bool guardNotified = false;
    uint32_t attacksResolved = 0;
};

/// Published for every resolved attack, hit or miss.
struct AttackEvent {
    foundation::AgentId attacker;
    foundation::AgentId target;
    AttackOutcome outcome;
    /// HP actually removed from the target.
    int32_t applied = 0;
    DamageType damageType = DamageType::Melee;
    FacingDirection facing = FacingDirection::Down;
    bool killedTarget = false;
};

/// Distances that govern a controller.
struct AttackControllerSettings {
    /// Attacks resolve only at or below this distance.
    float meleeRange = kMeleeRange;
    /// Sessions end when the target is farther than this; 0 disables.
    float leashRange = 0.0f;
};

/// Runs the attack loop of one agent.
///
/// At most one session exists at a time. Each tick, in order:
///   1. end the session if the attacker died, or the target is gone or dead;
///   2. end it if the target is beyond the leash range;
///   3. count the cooldown down, returning while it is still running;
///   4. when within melee range, resolve one attack and restart the cooldown
///      at the attacker's attack speed.
/// A hit that kills the target ends the session in the same tick.
///
/// Movement is not done here; the owning agent moves toward CurrentTarget().
class AttackController {
public:
    /// Builds a fresh attacker snapshot for each resolution.
    using StatsProvider = std::function<CombatantStats()>;

    /// Extra effect of a landed hit, such as poison.
    using HitEffect = std::function<void(const AttackEvent&)>;

    AttackController(CombatTarget& self,
                     StatsProvider stats,
                     const TargetRegistry& registry,
                     CombatResolver& resolver,
                     AttackControllerSettings settings = {});

    AttackController(const AttackController&) = delete;
    AttackController& operator=(const AttackController&) = delete;

    /// Start attacking @p target. Same target: no-op. Different target:
    /// the current session (and its pending cooldown) is cancelled first.
    EngageResult BeginAttacking(foundation::AgentId target);

    /// Stop the current session, if any, within this tick.
    void Cancel(SessionEndReason reason = SessionEndReason::Cancelled);

    /// Advance the session by one tick.
    void OnTick();

    /// Install the effect run on every landed hit, after the damage is
    /// applied and before OnAttack() fires. An empty function removes it.
    void SetOnHitEffect(HitEffect effect) { onHit_ = std::move(effect); }

    [[nodiscard]] bool IsEngaged() const noexcept { return session_.has_value(); }

    /// Current target id; invalid when not engaged.
    [[nodiscard]] foundation::AgentId CurrentTarget() const noexcept {
        return session_ ? session_->target : foundation::AgentId{};
    }

    [[nodiscard]] const AttackSession* Session() const noexcept {
        return session_ ? &*session_ : nullptr;
    }

    /// Facing recomputed on every resolved attack.
    [[nodiscard]] FacingDirection Facing() const noexcept { return facing_; }

    [[nodiscard]] const AttackControllerSettings& Settings() const noexcept { return settings_; }

    /// New target id, or an invalid id when the session ends.
    [[nodiscard]] foundation::Signal<foundation::AgentId>& OnTargetChanged() noexcept {
        return targetChanged_;
    }
    [[nodiscard]] foundation::Signal<const AttackEvent&>& OnAttack() noexcept { return attack_; }
    [[nodiscard]] foundation::Signal<foundation::AgentId>& OnTargetKilled() noexcept {
        return targetKilled_;
    }
    [[nodiscard]] foundation::Signal<foundation::AgentId, SessionEndReason>& OnSessionEnded() noexcept {
        return sessionEnded_;
    }

private:
    void Resolve(CombatTarget& target);
    void EndSession(SessionEndReason reason);

    CombatTarget& self_;
    StatsProvider stats_;
    const TargetRegistry& registry_;
    CombatResolver& resolver_;
    AttackControllerSettings settings_;
    HitEffect onHit_;

    std::optional<AttackSession> session_;
    FacingDirection facing_ = FacingDirection::Down;

    foundation::Signal<foundation::AgentId> targetChanged_;
    foundation::Signal<const AttackEvent&> attack_;
    foundation::Signal<foundation::AgentId> targetKilled_;
    foundation::Signal<foundation::AgentId, SessionEndReason> sessionEnded_;
};

} // namespace tcc::game
