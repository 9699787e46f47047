/// @file pet_progression.cpp
/// @brief PetProgression experience table and tiers.

#include "tcc/game/pet_progression.hpp"

#include <algorithm>
#include <cmath>

namespace tcc::game {

namespace {

using XpTable = std::array<int64_t, PetProgression::kMaxLevel>;

XpTable BuildXpTable() {
    XpTable table{};
    int64_t points = 0;
    for (int32_t level = 2; level <= PetProgression::kMaxLevel; ++level) {
        points += static_cast<int64_t>(std::floor(
            level + 300.0 * std::pow(2.0, static_cast<double>(level) / 7.0)));
        table[static_cast<std::size_t>(level - 1)] = points / 4;
    }
    return table;
}

const XpTable& Table() {
    static const XpTable table = BuildXpTable();
    return table;
}

} // namespace

PetProgression::PetProgression(double experience)
    : experience_(std::max(experience, 0.0)),
      level_(LevelForExperience(experience_)) {}

int64_t PetProgression::ExperienceForLevel(int32_t level) {
    if (level <= 1) {
        return 0;
    }
    const auto idx = static_cast<std::size_t>(std::min(level, kMaxLevel) - 1);
    return Table()[idx];
}

int32_t PetProgression::LevelForExperience(double experience) {
    const auto xp = static_cast<int64_t>(std::floor(std::max(experience, 0.0)));
    const auto& table = Table();
    for (int32_t i = kMaxLevel - 1; i >= 0; --i) {
        if (xp >= table[static_cast<std::size_t>(i)]) {
            return i + 1;
        }
    }
    return 1;
}

float PetProgression::StatMultiplierForLevel(int32_t level) noexcept {
    if (level >= 50) {
        return 1.0f;
    }
    if (level >= 25) {
        return 0.75f;
    }
    return 0.5f;
}

int32_t PetProgression::AddExperience(double amount) {
    if (!(amount > 0.0) || level_ >= kMaxLevel) {
        return 0;
    }
    experience_ += amount;
    const int32_t previous = level_;
    level_ = std::clamp(LevelForExperience(experience_), 1, kMaxLevel);
    if (level_ != previous) {
        levelChanged_.emit(previous, level_);
    }
    return level_ - previous;
}

int64_t PetProgression::ExperienceToNextLevel() const {
    if (level_ >= kMaxLevel) {
        return 0;
    }
    return ExperienceForLevel(level_ + 1) - static_cast<int64_t>(std::floor(experience_));
}

void PetProgression::SetEvolutionTiers(std::vector<EvolutionTier> tiers) {
    std::stable_sort(tiers.begin(), tiers.end(),
                     [](const EvolutionTier& a, const EvolutionTier& b) {
                         return a.minLevel < b.minLevel;
                     });
    tiers_ = std::move(tiers);
}

const EvolutionTier* PetProgression::CurrentTier() const {
    const EvolutionTier* current = nullptr;
    for (const auto& tier : tiers_) {
        if (level_ >= tier.minLevel) {
            current = &tier;
        }
    }
    return current;
}

} // namespace tcc::game
