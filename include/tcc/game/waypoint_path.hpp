#pragma once

/// @file waypoint_path.hpp
/// @brief Ordered waypoint list anchored to a movable origin.

#include <cstddef>
#include <vector>

#include "tcc/foundation/game_result.hpp"
#include "tcc/game/math_types.hpp"

namespace tcc::game {

/// One point of a path, relative to the path origin.
struct Waypoint {
    Vector2 position;
    /// Pause on arrival (seconds).
    float waitSeconds = 0.0f;
    /// Multiplier on the follower's base speed while heading here.
    float speedMultiplier = 1.0f;
};

/// Reusable patrol route.
///
/// Points are stored relative to an origin so the whole path can be moved;
/// followers either read live world positions or snapshot them at start.
class WaypointPath {
public:
    /// @return The path, or InvalidWaypointPath when @p points is empty.
    [[nodiscard]] static foundation::GameResult<WaypointPath> Create(std::vector<Waypoint> points,
                                                                    Vector2 origin = {});

    /// World position of point @p index; out-of-range indices are clamped.
    [[nodiscard]] Vector2 WorldPoint(std::size_t index) const noexcept;

    /// Wait at @p index, never negative; 0 when out of range.
    [[nodiscard]] float WaitSeconds(std::size_t index) const noexcept;

    /// Speed multiplier at @p index, at least kMinWaypointSpeedMultiplier;
    /// 1 when out of range.
    [[nodiscard]] float SpeedMultiplier(std::size_t index) const noexcept;

    /// Index of the point closest to @p position.
    [[nodiscard]] std::size_t NearestIndex(const Vector2& position) const noexcept;

    void SetOrigin(const Vector2& origin) noexcept { origin_ = origin; }
    [[nodiscard]] const Vector2& Origin() const noexcept { return origin_; }

    [[nodiscard]] std::size_t Size() const noexcept { return points_.size(); }
    [[nodiscard]] const std::vector<Waypoint>& Points() const noexcept { return points_; }

private:
    WaypointPath(std::vector<Waypoint> points, Vector2 origin);

    std::vector<Waypoint> points_;
    Vector2 origin_;
};

} // namespace tcc::game
