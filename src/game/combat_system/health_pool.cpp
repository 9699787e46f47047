#include "tcc/game/health_pool.hpp"

#include <algorithm>

namespace tcc::game {

HealthPool::HealthPool(foundation::AgentId owner, int32_t maxHp)
    : owner_(owner), max_(std::max(maxHp, 0)), current_(max_) {}

int32_t HealthPool::ApplyDamage(int32_t amount, DamageType type, const DamageSource& source) {
    if (amount <= 0 || current_ <= 0) {
        return 0;
    }

    const int32_t previous = current_;
    current_ = std::max(current_ - amount, 0);
    const int32_t applied = previous - current_;

    HealthChangedEvent changed;
    changed.agent = owner_;
    changed.previousHp = previous;
    changed.currentHp = current_;
    changed.maxHp = max_;
    changed.delta = -applied;
    changed.damageType = type;
    changed.source = source;
    const bool died = current_ == 0;
    DeathEvent death;
    death.agent = owner_;
    death.killer = source;
    death.damageType = type;
    death.life = life_;

    healthChanged_.emit(changed);
    if (died) {
        death_.emit(death);
    }
    return applied;
}

void HealthPool::Restore() {
    const int32_t previous = current_;
    current_ = max_;
    ++life_;

    HealthChangedEvent changed;
    changed.agent = owner_;
    changed.previousHp = previous;
    changed.currentHp = current_;
    changed.maxHp = max_;
    changed.delta = current_ - previous;
    healthChanged_.emit(changed);
}

void HealthPool::SetMax(int32_t maxHp) {
    max_ = std::max(maxHp, 0);
    current_ = std::min(current_, max_);
}

} // namespace tcc::game
