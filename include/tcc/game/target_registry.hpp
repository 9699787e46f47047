#pragma once

/// @file target_registry.hpp
/// @brief Id-to-target lookup so sessions never hold dangling pointers.

#include <cstddef>
#include <vector>

#include "tcc/foundation/game_result.hpp"
#include "tcc/foundation/types.hpp"
#include "tcc/game/combat_target.hpp"

namespace tcc::game {

/// Registry of live combat targets keyed by AgentId.
///
/// Attack sessions store ids and resolve them through Find() on every tick;
/// an agent that unregisters (despawns) simply stops being found. Iteration
/// order is registration order, which keeps aggro scans deterministic.
class TargetRegistry {
public:
    /// @return Success, InvalidArgument for an invalid id, or AlreadyExists.
    foundation::GameResult<void> Register(CombatTarget& target);

    /// @return Success or TargetNotFound.
    foundation::GameResult<void> Unregister(foundation::AgentId id);

    /// Live target with @p id, or nullptr.
    [[nodiscard]] CombatTarget* Find(foundation::AgentId id) const;

    [[nodiscard]] bool Contains(foundation::AgentId id) const { return Find(id) != nullptr; }

    /// All registered targets in registration order.
    [[nodiscard]] const std::vector<CombatTarget*>& All() const noexcept { return targets_; }

    [[nodiscard]] std::size_t Size() const noexcept { return targets_.size(); }

private:
    std::vector<CombatTarget*> targets_;
};

} // namespace tcc::game
