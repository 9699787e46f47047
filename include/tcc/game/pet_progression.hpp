#pragma once

/// @file pet_progression.hpp
/// @brief Pet level, experience table, stat tiers and evolution tiers.

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "tcc/foundation/signal.hpp"

namespace tcc::game {

/// Appearance stage unlocked at a pet level.
struct EvolutionTier {
    int32_t minLevel = 1;
    std::string name;
    float scale = 1.0f;
};

/// Experience and level of one pet.
///
/// The experience curve is fixed: for each level L from 2 upward a running
/// total grows by floor(L + 300 * 2^(L/7)), and reaching L needs a quarter
/// of that total.
class PetProgression {
public:
    static constexpr int32_t kMaxLevel = 99;

    explicit PetProgression(double experience = 0.0);

    /// Experience needed to reach @p level (0 for level 1 and below).
    [[nodiscard]] static int64_t ExperienceForLevel(int32_t level);

    /// Level reached with @p experience.
    [[nodiscard]] static int32_t LevelForExperience(double experience);

    /// Stat tier: 1.0 from level 50, 0.75 from level 25, otherwise 0.5.
    [[nodiscard]] static float StatMultiplierForLevel(int32_t level) noexcept;

    /// Add experience. Ignored when non-positive or at max level.
    /// @return Number of levels gained.
    int32_t AddExperience(double amount);

    [[nodiscard]] int32_t Level() const noexcept { return level_; }
    [[nodiscard]] double Experience() const noexcept { return experience_; }
    [[nodiscard]] float StatMultiplier() const noexcept { return StatMultiplierForLevel(level_); }

    /// Experience still needed for the next level; 0 at max level.
    [[nodiscard]] int64_t ExperienceToNextLevel() const;

    /// Tiers sorted by minLevel on assignment.
    void SetEvolutionTiers(std::vector<EvolutionTier> tiers);

    /// Highest tier whose minLevel has been reached, or nullptr.
    [[nodiscard]] const EvolutionTier* CurrentTier() const;

    /// Fires (previousLevel, newLevel) on every level change.
    [[nodiscard]] foundation::Signal<int32_t, int32_t>& OnLevelChanged() noexcept {
        return levelChanged_;
    }

private:
    double experience_;
    int32_t level_;
    std::vector<EvolutionTier> tiers_;
    foundation::Signal<int32_t, int32_t> levelChanged_;
};

} // namespace tcc::game
