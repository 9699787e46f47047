#pragma once

/// @file math_types.hpp
/// @brief 2D vector math for tile-space positions.

#include <algorithm>
#include <cmath>

namespace tcc::game {

/// Two-component floating-point vector in tile units.
struct Vector2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vector2() = default;
    constexpr Vector2(float x, float y) : x(x), y(y) {}

    constexpr Vector2 operator+(const Vector2& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y};
    }
    constexpr Vector2 operator-(const Vector2& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y};
    }
    constexpr Vector2 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar};
    }

    constexpr Vector2& operator+=(const Vector2& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    [[nodiscard]] constexpr float Dot(const Vector2& rhs) const noexcept {
        return x * rhs.x + y * rhs.y;
    }

    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Normalized copy, or the zero vector if length is near zero.
    [[nodiscard]] Vector2 Normalized() const noexcept {
        const float len = Length();
        if (len < 1e-6f) {
            return {};
        }
        return {x / len, y / len};
    }

    [[nodiscard]] static constexpr Vector2 Zero() noexcept { return {}; }

    constexpr bool operator==(const Vector2&) const = default;
};

constexpr Vector2 operator*(float scalar, const Vector2& v) noexcept {
    return v * scalar;
}

/// Euclidean distance between two points.
[[nodiscard]] inline float Distance(const Vector2& a, const Vector2& b) noexcept {
    return (b - a).Length();
}

/// Step from @p current toward @p target by at most @p maxDelta, never overshooting.
[[nodiscard]] inline Vector2 MoveTowards(const Vector2& current, const Vector2& target,
                                         float maxDelta) noexcept {
    const Vector2 delta = target - current;
    const float dist = delta.Length();
    if (dist <= maxDelta || dist < 1e-6f) {
        return target;
    }
    return current + delta * (maxDelta / dist);
}

/// Linear interpolation with @p t clamped to [0,1]; t >= 1 yields @p to exactly.
[[nodiscard]] inline Vector2 Lerp(const Vector2& from, const Vector2& to, float t) noexcept {
    if (!(t > 0.0f)) {
        return from;
    }
    if (t >= 1.0f) {
        return to;
    }
    return from + (to - from) * t;
}

/// Axis-aligned rectangle given by its inclusive corners.
struct Rect {
    Vector2 min;
    Vector2 max;

    [[nodiscard]] Vector2 Clamp(const Vector2& p) const noexcept {
        return {std::clamp(p.x, min.x, max.x), std::clamp(p.y, min.y, max.y)};
    }

    [[nodiscard]] bool Contains(const Vector2& p) const noexcept {
        return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
    }
};

} // namespace tcc::game
