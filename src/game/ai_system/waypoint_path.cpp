/// @file waypoint_path.cpp
/// @brief WaypointPath construction and per-point queries.

#include "tcc/game/waypoint_path.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include "tcc/game/ai_types.hpp"

namespace tcc::game {

WaypointPath::WaypointPath(std::vector<Waypoint> points, Vector2 origin)
    : points_(std::move(points)), origin_(origin) {}

foundation::GameResult<WaypointPath> WaypointPath::Create(std::vector<Waypoint> points,
                                                          Vector2 origin) {
    if (points.empty()) {
        return foundation::GameResult<WaypointPath>::err(foundation::GameError(
            foundation::ErrorCode::InvalidWaypointPath, "waypoint path has no points"));
    }
    return foundation::GameResult<WaypointPath>::ok(WaypointPath(std::move(points), origin));
}

Vector2 WaypointPath::WorldPoint(std::size_t index) const noexcept {
    const std::size_t clamped = std::min(index, points_.size() - 1);
    return origin_ + points_[clamped].position;
}

float WaypointPath::WaitSeconds(std::size_t index) const noexcept {
    if (index >= points_.size()) {
        return 0.0f;
    }
    return std::max(0.0f, points_[index].waitSeconds);
}

float WaypointPath::SpeedMultiplier(std::size_t index) const noexcept {
    if (index >= points_.size()) {
        return 1.0f;
    }
    return std::max(kMinWaypointSpeedMultiplier, points_[index].speedMultiplier);
}

std::size_t WaypointPath::NearestIndex(const Vector2& position) const noexcept {
    std::size_t best = 0;
    float bestDistSq = std::numeric_limits<float>::max();
    for (std::size_t i = 0; i < points_.size(); ++i) {
        const float d = (WorldPoint(i) - position).LengthSquared();
        if (d < bestDistSq) {
            bestDistSq = d;
            best = i;
        }
    }
    return best;
}

} // namespace tcc::game
