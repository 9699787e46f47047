#pragma once

/// @file random_source.hpp
/// @brief Injectable randomness for combat rolls and wander decisions.

#include <cstdint>
#include <random>

namespace tcc::foundation {

/// Source of uniform random numbers.
///
/// Everything that rolls dice takes a RandomSource& so tests can script
/// the outcome and simulations can be replayed from a seed.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Uniform integer in [min, max] inclusive. Returns @p min when max < min.
    virtual int32_t NextInt(int32_t min, int32_t max) = 0;

    /// Uniform float in [min, max). Returns @p min when max <= min.
    virtual float NextFloat(float min, float max) = 0;
};

/// RandomSource backed by std::mt19937.
class Mt19937RandomSource final : public RandomSource {
public:
    explicit Mt19937RandomSource(uint32_t seed = std::mt19937::default_seed);

    int32_t NextInt(int32_t min, int32_t max) override;
    float NextFloat(float min, float max) override;

    /// Restart the sequence from @p seed.
    void Reseed(uint32_t seed);

private:
    std::mt19937 engine_;
};

} // namespace tcc::foundation
