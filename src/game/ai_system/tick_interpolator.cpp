#include "tcc/game/tick_interpolator.hpp"

#include <algorithm>

namespace tcc::game {

TickInterpolator::TickInterpolator(Vector2 start, float tickSeconds)
    : from_(start), to_(start), tickSeconds_(tickSeconds > 0.0f ? tickSeconds : kTickSeconds) {}

void TickInterpolator::BeginWindow(const Vector2& from, const Vector2& to) noexcept {
    from_ = from;
    to_ = to;
    elapsed_ = 0.0f;
}

Vector2 TickInterpolator::Advance(float deltaSeconds) noexcept {
    if (deltaSeconds > 0.0f) {
        elapsed_ = std::min(elapsed_ + deltaSeconds, tickSeconds_);
    }
    return Sample();
}

void TickInterpolator::SetElapsed(float elapsedSeconds) noexcept {
    elapsed_ = std::clamp(elapsedSeconds, 0.0f, tickSeconds_);
}

Vector2 TickInterpolator::SampleAt(float elapsedSeconds) const noexcept {
    return Lerp(from_, to_, elapsedSeconds / tickSeconds_);
}

} // namespace tcc::game
