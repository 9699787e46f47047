/// @file tick_scheduler.cpp
/// @brief TickScheduler implementation.

#include "tcc/service/tick_scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

TickScheduler::TickScheduler(std::chrono::milliseconds tickDuration)
    : tickDuration_(tickDuration.count() > 0 ? tickDuration : kDefaultTickDuration),
      tickSeconds_(static_cast<float>(tickDuration_.count()) / 1000.0f) {}

GameResult<void> TickScheduler::subscribe(ITickable* agent) {
    if (agent == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "cannot subscribe a null agent"));
    }
    if (members_.insert(agent).second) {
        subscribers_.push_back(agent);
    }
    return GameResult<void>::ok();
}

GameResult<void> TickScheduler::unsubscribe(ITickable* agent) {
    if (agent == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "cannot unsubscribe a null agent"));
    }
    if (members_.erase(agent) == 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::TickSubscriberNotFound, "agent is not subscribed"));
    }
    subscribers_.erase(std::find(subscribers_.begin(), subscribers_.end(), agent));
    return GameResult<void>::ok();
}

bool TickScheduler::isSubscribed(const ITickable* agent) const {
    return members_.count(agent) > 0;
}

uint32_t TickScheduler::advance(float elapsedSeconds) {
    if (paused_ || !std::isfinite(elapsedSeconds) || elapsedSeconds <= 0.0f) {
        return 0;
    }

    accumulator_ += elapsedSeconds;

    uint32_t fired = 0;
    while (accumulator_ >= tickSeconds_) {
        if (fired == kMaxTicksPerAdvance) {
            // Drop the backlog instead of spiralling after a long stall.
            const auto dropped = static_cast<uint64_t>(accumulator_ / tickSeconds_);
            accumulator_ = std::fmod(accumulator_, tickSeconds_);
            TCC_LOG_WARN(LogCategory::Tick,
                         "tick backlog dropped: " + std::to_string(dropped) + " ticks");
            break;
        }
        accumulator_ -= tickSeconds_;
        executeTick();
        ++fired;
    }
    return fired;
}

TickMetrics TickScheduler::step() {
    return executeTick();
}

float TickScheduler::interpolationAlpha() const noexcept {
    return std::clamp(accumulator_ / tickSeconds_, 0.0f, 1.0f);
}

TickMetrics TickScheduler::executeTick() {
    const auto start = std::chrono::steady_clock::now();

    // Dispatch over a snapshot; agents removed mid-tick are skipped.
    const std::vector<ITickable*> snapshot = subscribers_;
    for (ITickable* agent : snapshot) {
        if (isSubscribed(agent)) {
            agent->OnTick();
        }
    }

    const auto updateDuration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    const auto targetUs = std::chrono::duration_cast<std::chrono::microseconds>(tickDuration_);

    TickMetrics metrics;
    metrics.updateTime = updateDuration;
    metrics.budgetUtilization =
        targetUs.count() > 0
            ? static_cast<float>(updateDuration.count()) / static_cast<float>(targetUs.count())
            : 0.0f;
    metrics.tickNumber = tickCount_++;
    metrics.subscriberCount = snapshot.size();
    metrics.overrun = updateDuration > targetUs;

    if (metrics.overrun) {
        TCC_LOG_WARN(LogCategory::Tick,
                     "tick " + std::to_string(metrics.tickNumber) + " overran its budget");
    }

    lastMetrics_ = metrics;
    if (metricsCallback_) {
        metricsCallback_(metrics);
    }
    return metrics;
}

} // namespace tcc::service
