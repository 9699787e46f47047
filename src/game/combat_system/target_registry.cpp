#include "tcc/game/target_registry.hpp"

#include <algorithm>
#include <string>

namespace tcc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

GameResult<void> TargetRegistry::Register(CombatTarget& target) {
    const auto id = target.Id();
    if (!id.isValid()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "combat target has an invalid id"));
    }
    if (Find(id) != nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::AlreadyExists,
                      "combat target already registered: " + std::to_string(id.value()), id));
    }
    targets_.push_back(&target);
    return GameResult<void>::ok();
}

GameResult<void> TargetRegistry::Unregister(foundation::AgentId id) {
    auto it = std::find_if(targets_.begin(), targets_.end(),
                           [id](const CombatTarget* t) { return t->Id() == id; });
    if (it == targets_.end()) {
        return GameResult<void>::err(
            GameError(ErrorCode::TargetNotFound,
                      "combat target not registered: " + std::to_string(id.value()), id));
    }
    targets_.erase(it);
    return GameResult<void>::ok();
}

CombatTarget* TargetRegistry::Find(foundation::AgentId id) const {
    if (!id.isValid()) {
        return nullptr;
    }
    auto it = std::find_if(targets_.begin(), targets_.end(),
                           [id](const CombatTarget* t) { return t->Id() == id; });
    return it != targets_.end() ? *it : nullptr;
}

} // namespace tcc::game
