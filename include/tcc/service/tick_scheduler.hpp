#pragma once

/// @file tick_scheduler.hpp
/// @brief Fixed-period tick dispatch decoupled from the render frame rate.
///
/// TickScheduler accumulates frame time and fires OnTick() on every
/// subscriber once per elapsed tick period (default 600 ms), in
/// subscription order, on the caller's thread. Each fired tick is timed
/// against the period and reported as TickMetrics.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <unordered_set>
#include <vector>

#include "tcc/core/tickable.hpp"
#include "tcc/foundation/game_result.hpp"

namespace tcc::service {

/// Default tick period.
inline constexpr std::chrono::milliseconds kDefaultTickDuration{600};

/// Most ticks one advance() call will fire; the rest of a long stall is dropped.
inline constexpr uint32_t kMaxTicksPerAdvance = 10;

/// Per-tick performance metrics.
struct TickMetrics {
    /// Time spent dispatching OnTick() to all subscribers.
    std::chrono::microseconds updateTime{0};

    /// Ratio of updateTime to the tick period (1.0 = full budget).
    float budgetUtilization = 0.0f;

    /// Monotonically increasing tick counter (starts at 0).
    uint64_t tickNumber = 0;

    /// Number of subscribers the tick was dispatched to.
    std::size_t subscriberCount = 0;

    /// True when updateTime exceeded the tick period.
    bool overrun = false;
};

/// Single-threaded fixed-period tick source.
///
/// Usage:
/// @code
///   TickScheduler scheduler;             // 600 ms
///   scheduler.subscribe(&npc);
///   // per rendered frame:
///   scheduler.advance(frameSeconds);
///   npc.Update(frameSeconds);
/// @endcode
class TickScheduler {
public:
    using MetricsCallback = std::function<void(const TickMetrics&)>;

    /// Construct with the given tick period. Non-positive periods fall back
    /// to the default.
    explicit TickScheduler(std::chrono::milliseconds tickDuration = kDefaultTickDuration);

    TickScheduler(const TickScheduler&) = delete;
    TickScheduler& operator=(const TickScheduler&) = delete;

    /// Add @p agent to the end of the dispatch order.
    /// Subscribing an agent twice is a no-op.
    /// @return Success or InvalidArgument for a null agent.
    foundation::GameResult<void> subscribe(ITickable* agent);

    /// Remove @p agent. Safe from inside a tick; the agent is not called
    /// again, even later in the same tick.
    /// @return Success, InvalidArgument, or TickSubscriberNotFound.
    foundation::GameResult<void> unsubscribe(ITickable* agent);

    [[nodiscard]] bool isSubscribed(const ITickable* agent) const;
    [[nodiscard]] std::size_t subscriberCount() const noexcept { return subscribers_.size(); }

    /// Accumulate @p elapsedSeconds of frame time and fire every tick that
    /// became due. Negative or non-finite input is ignored.
    /// @return Number of ticks fired.
    uint32_t advance(float elapsedSeconds);

    /// Fire exactly one tick now, regardless of accumulated time.
    TickMetrics step();

    /// Stop accumulating frame time; step() still works.
    void pause() noexcept { paused_ = true; }
    void resume() noexcept { paused_ = false; }
    [[nodiscard]] bool isPaused() const noexcept { return paused_; }

    /// Fraction of the current tick period already elapsed, in [0,1].
    [[nodiscard]] float interpolationAlpha() const noexcept;

    /// Seconds elapsed since the last tick fired.
    [[nodiscard]] float elapsedInTick() const noexcept { return accumulator_; }

    [[nodiscard]] std::chrono::milliseconds tickDuration() const noexcept { return tickDuration_; }
    [[nodiscard]] float tickSeconds() const noexcept { return tickSeconds_; }

    /// Number of ticks fired so far.
    [[nodiscard]] uint64_t currentTick() const noexcept { return tickCount_; }

    /// Set an optional callback invoked after each tick with metrics.
    void setMetricsCallback(MetricsCallback callback) { metricsCallback_ = std::move(callback); }

    /// Get the metrics from the last completed tick.
    [[nodiscard]] const TickMetrics& lastMetrics() const noexcept { return lastMetrics_; }

private:
    TickMetrics executeTick();

    std::chrono::milliseconds tickDuration_;
    float tickSeconds_;
    float accumulator_ = 0.0f;
    bool paused_ = false;
    uint64_t tickCount_ = 0;

    /// Dispatch order.
    std::vector<ITickable*> subscribers_;
    /// Same agents as subscribers_, for constant-time membership checks
    /// while a tick walks its snapshot.
    std::unordered_set<const ITickable*> members_;
    MetricsCallback metricsCallback_;
    TickMetrics lastMetrics_;
};

} // namespace tcc::service
