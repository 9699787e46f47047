/// @file path_follower.cpp
/// @brief PathFollower tick planning and index traversal.

#include "tcc/game/path_follower.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "tcc/foundation/game_logger.hpp"
#include "tcc/game/facing.hpp"

namespace tcc::game {

PathFollower::PathFollower(const WaypointPath& path, PathFollowerSettings settings,
                           foundation::AgentId owner)
    : path_(path),
      settings_(settings),
      owner_(owner),
      window_({}, settings.tickSeconds > 0.0f ? settings.tickSeconds : kTickSeconds) {
    settings_.tickSeconds = window_.TickSeconds();
}

void PathFollower::Start(const Vector2& position) {
    snapshot_.clear();
    if (settings_.snapshotAtStart) {
        snapshot_.reserve(path_.Size());
        for (std::size_t i = 0; i < path_.Size(); ++i) {
            snapshot_.push_back(path_.WorldPoint(i));
        }
    }

    if (settings_.startAtNearest) {
        std::size_t best = 0;
        float bestDistSq = std::numeric_limits<float>::max();
        for (std::size_t i = 0; i < path_.Size(); ++i) {
            const float d = (PointAt(i) - position).LengthSquared();
            if (d < bestDistSq) {
                bestDistSq = d;
                best = i;
            }
        }
        index_ = best;
    } else {
        index_ = 0;
    }

    step_ = 1;
    waiting_ = false;
    waitRemaining_ = 0.0f;
    finished_ = false;
    moving_ = false;
    running_ = true;
    window_.Snap(settings_.snapToFirstOnStart ? PointAt(index_) : position);

    foundation::LogContext ctx;
    ctx.agentId = owner_;
    ctx.extra["index"] = std::to_string(index_);
    TCC_LOG_CTX(foundation::LogLevel::Debug, foundation::LogCategory::Movement,
                "path follow started", ctx);
}

void PathFollower::Stop() {
    running_ = false;
    waiting_ = false;
    moving_ = false;
    window_.Snap(window_.To());
}

void PathFollower::OnTick() {
    const Vector2 from = window_.To();
    moving_ = false;

    if (!running_ || finished_ || path_.Size() == 0) {
        window_.BeginWindow(from, from);
        return;
    }

    if (waiting_) {
        waitRemaining_ -= settings_.tickSeconds;
        if (waitRemaining_ <= 0.0f) {
            waiting_ = false;
            AdvanceIndex();
        }
        window_.BeginWindow(from, from);
        return;
    }

    Vector2 target = PointAt(index_);
    if (Distance(from, target) <= settings_.arriveDistance) {
        HandleArrival();
        window_.BeginWindow(from, from);
        return;
    }

    const float speed = std::max(0.0f, settings_.moveSpeed) * path_.SpeedMultiplier(index_);
    const Vector2 to = MoveTowards(from, target, speed * settings_.tickSeconds);
    moving_ = !(to == from);
    if (moving_) {
        facing_ = FacingFromDelta(to - from);
    }
    if (Distance(to, target) <= settings_.arriveDistance) {
        HandleArrival();
    }
    window_.BeginWindow(from, to);
}

Vector2 PathFollower::PointAt(std::size_t index) const noexcept {
    if (!snapshot_.empty()) {
        return snapshot_[std::min(index, snapshot_.size() - 1)];
    }
    return path_.WorldPoint(index);
}

void PathFollower::HandleArrival() {
    const float wait = path_.WaitSeconds(index_);
    if (wait > 0.0f) {
        waiting_ = true;
        waitRemaining_ = wait;
        return;
    }
    AdvanceIndex();
}

void PathFollower::AdvanceIndex() {
    const std::size_t n = path_.Size();
    if (n == 0) {
        return;
    }

    switch (settings_.mode) {
        case PathLoopMode::Once:
            if (index_ + 1 >= n) {
                finished_ = true;
                TCC_LOG_DEBUG(foundation::LogCategory::Movement, "path finished");
                return;
            }
            ++index_;
            return;

        case PathLoopMode::PingPong: {
            if (n == 1) {
                return;
            }
            const auto next = static_cast<long long>(index_) + step_;
            if (next >= static_cast<long long>(n)) {
                step_ = -1;
                index_ = n - 2;
            } else if (next < 0) {
                step_ = 1;
                index_ = 1;
            } else {
                index_ = static_cast<std::size_t>(next);
            }
            return;
        }

        case PathLoopMode::Loop:
            index_ = (index_ + 1) % n;
            return;
    }
}

} // namespace tcc::game
