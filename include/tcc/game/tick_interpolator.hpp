#pragma once

/// @file tick_interpolator.hpp
/// @brief Render-side interpolation across one tick window.

#include "tcc/game/combat_types.hpp"
#include "tcc/game/math_types.hpp"

namespace tcc::game {

/// Holds the (from, to) pair planned for the current tick window and the
/// frame time elapsed inside it.
///
/// Only BeginWindow()/Snap() change the pair, and only tick code calls them.
/// Frame code calls Advance()/Sample(), which never alter the plan. Sampling
/// at elapsed >= tick duration yields `to` exactly.
class TickInterpolator {
public:
    explicit TickInterpolator(Vector2 start = {}, float tickSeconds = kTickSeconds);

    /// Start a new window; elapsed time resets to zero.
    void BeginWindow(const Vector2& from, const Vector2& to) noexcept;

    /// Place at @p position with no motion.
    void Snap(const Vector2& position) noexcept { BeginWindow(position, position); }

    /// Add frame time and return the new render position.
    Vector2 Advance(float deltaSeconds) noexcept;

    /// Set the time elapsed since the window began.
    void SetElapsed(float elapsedSeconds) noexcept;

    /// Render position at the current elapsed time.
    [[nodiscard]] Vector2 Sample() const noexcept { return SampleAt(elapsed_); }

    /// Render position @p elapsedSeconds into the window.
    [[nodiscard]] Vector2 SampleAt(float elapsedSeconds) const noexcept;

    [[nodiscard]] const Vector2& From() const noexcept { return from_; }
    [[nodiscard]] const Vector2& To() const noexcept { return to_; }
    [[nodiscard]] float Elapsed() const noexcept { return elapsed_; }
    [[nodiscard]] float TickSeconds() const noexcept { return tickSeconds_; }

private:
    Vector2 from_;
    Vector2 to_;
    float elapsed_ = 0.0f;
    float tickSeconds_;
};

} // namespace tcc::game
