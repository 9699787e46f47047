#pragma once

/// @file path_follower.hpp
/// @brief Tick-driven patrol along a WaypointPath.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "tcc/foundation/types.hpp"
#include "tcc/game/ai_types.hpp"
#include "tcc/game/combat_types.hpp"
#include "tcc/game/tick_interpolator.hpp"
#include "tcc/game/waypoint_path.hpp"

namespace tcc::game {

/// Traversal at the ends of a path.
enum class PathLoopMode : uint8_t {
    Loop,     ///< Wrap from the last point to the first.
    PingPong, ///< Reverse direction at either end.
    Once      ///< Stop at the last point.
};

struct PathFollowerSettings {
    float moveSpeed = kDefaultWanderSpeed;
    float arriveDistance = kDefaultArriveDistance;
    float tickSeconds = kTickSeconds;
    PathLoopMode mode = PathLoopMode::Loop;
    /// Begin at the point nearest the start position instead of point 0.
    bool startAtNearest = false;
    /// Freeze world positions at Start() so later origin moves are ignored.
    bool snapshotAtStart = true;
    /// Place the follower on its first target at Start().
    bool snapToFirstOnStart = false;
};

/// Moves an agent along a WaypointPath one tick window at a time.
///
/// The path must outlive the follower. Arrival is checked at the start of a
/// tick and again after the move, so a follower that lands on a point waits
/// or turns toward the next one without losing a tick.
class PathFollower {
public:
    PathFollower(const WaypointPath& path, PathFollowerSettings settings,
                 foundation::AgentId owner = {});

    /// Begin following from @p position.
    void Start(const Vector2& position);

    /// Stop in place; Start() resumes from the current position.
    void Stop();

    /// Plan the next tick window.
    void OnTick();

    Vector2 Update(float deltaSeconds) noexcept { return window_.Advance(deltaSeconds); }

    [[nodiscard]] bool IsRunning() const noexcept { return running_; }
    /// Once mode only: the last point has been reached (and waited out).
    [[nodiscard]] bool IsFinished() const noexcept { return finished_; }
    [[nodiscard]] bool IsWaiting() const noexcept { return waiting_; }

    [[nodiscard]] std::size_t CurrentIndex() const noexcept { return index_; }
    /// +1 or -1; only PingPong ever reverses.
    [[nodiscard]] int Direction() const noexcept { return step_; }

    [[nodiscard]] Vector2 Position() const noexcept { return window_.To(); }
    [[nodiscard]] Vector2 RenderPosition() const noexcept { return window_.Sample(); }
    [[nodiscard]] const TickInterpolator& Window() const noexcept { return window_; }

    [[nodiscard]] FacingDirection Facing() const noexcept { return facing_; }

    /// Wandering while the last window moved, Idle otherwise.
    [[nodiscard]] BehaviorState State() const noexcept {
        return moving_ ? BehaviorState::Wandering : BehaviorState::Idle;
    }

    /// World position of point @p index as this follower sees it.
    [[nodiscard]] Vector2 PointAt(std::size_t index) const noexcept;

private:
    void HandleArrival();
    void AdvanceIndex();

    const WaypointPath& path_;
    PathFollowerSettings settings_;
    foundation::AgentId owner_;

    std::vector<Vector2> snapshot_;
    std::size_t index_ = 0;
    int step_ = 1;
    bool running_ = false;
    bool finished_ = false;
    bool waiting_ = false;
    bool moving_ = false;
    float waitRemaining_ = 0.0f;
    FacingDirection facing_ = FacingDirection::Down;
    TickInterpolator window_;
};

} // namespace tcc::game
