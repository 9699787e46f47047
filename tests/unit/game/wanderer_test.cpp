#include <gtest/gtest.h>

#include <cmath>
#include <utility>
#include <vector>

#include "support/test_doubles.hpp"
#include "tcc/game/wanderer.hpp"

using namespace tcc::game;
using tcc::foundation::AgentId;
using tcc::foundation::ErrorCode;
using tcc::foundation::ScopedConnection;
using tcc::test::ScriptedRandomSource;

namespace {

void ExpectAt(const Vector2& actual, const Vector2& expected) {
    EXPECT_NEAR(actual.x, expected.x, 1e-4f);
    EXPECT_NEAR(actual.y, expected.y, 1e-4f);
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// WanderBounds
// ═══════════════════════════════════════════════════════════════════════════

TEST(WanderBoundsTest, OffsetRectangleAroundOrigin) {
    WanderBounds bounds;
    bounds.minOffset = {-2.0f, -1.0f};
    bounds.maxOffset = {3.0f, 4.0f};

    Rect rect = bounds.WorldRect({10.0f, 10.0f});
    EXPECT_EQ(rect.min, (Vector2{8.0f, 9.0f}));
    EXPECT_EQ(rect.max, (Vector2{13.0f, 14.0f}));
}

TEST(WanderBoundsTest, AreaSizeIsCentred) {
    WanderBounds bounds;
    bounds.useAreaSize = true;
    bounds.areaSize = {6.0f, 8.0f};

    Rect rect = bounds.WorldRect({1.0f, 1.0f});
    EXPECT_EQ(rect.min, (Vector2{-2.0f, -3.0f}));
    EXPECT_EQ(rect.max, (Vector2{4.0f, 5.0f}));
    EXPECT_FLOAT_EQ(bounds.DerivedAggroRadius(), 5.0f);
}

TEST(WanderBoundsTest, DerivedRadiusReachesFarthestCorner) {
    WanderBounds bounds;
    bounds.minOffset = {-1.0f, -1.0f};
    bounds.maxOffset = {3.0f, 4.0f};
    EXPECT_FLOAT_EQ(bounds.DerivedAggroRadius(), 5.0f);

    WanderBounds defaults;
    EXPECT_NEAR(defaults.DerivedAggroRadius(), std::sqrt(50.0f), 1e-5f);
}

TEST(WanderBoundsTest, ValidateRejectsInvertedOffsets) {
    WanderBounds bounds;
    EXPECT_TRUE(bounds.Validate().hasValue());

    bounds.minOffset = {2.0f, 0.0f};
    bounds.maxOffset = {1.0f, 0.0f};
    auto result = bounds.Validate();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidWanderBounds);

    WanderBounds area;
    area.useAreaSize = true;
    area.areaSize = {-1.0f, 2.0f};
    EXPECT_TRUE(area.Validate().hasError());
}

// ═══════════════════════════════════════════════════════════════════════════
// Wanderer: 0.5 s ticks at 2 tiles/s move exactly one tile per tick
// ═══════════════════════════════════════════════════════════════════════════

class WandererTest : public ::testing::Test {
protected:
    static constexpr float kTick = 0.5f;

    Wanderer Make(WanderSettings settings = {}, float aggroRange = 0.0f) {
        return Wanderer(AgentId(7), {0.0f, 0.0f}, WanderBounds{}, settings, rng_, kTick,
                        kMeleeRange, aggroRange);
    }

    ScriptedRandomSource rng_;
};

TEST_F(WandererTest, StartsIdleAtOrigin) {
    auto wanderer = Make();
    EXPECT_EQ(wanderer.State(), BehaviorState::Idle);
    ExpectAt(wanderer.Position(), Vector2{0.0f, 0.0f});
    EXPECT_FLOAT_EQ(wanderer.IdleRemaining(), kDefaultMinIdleSeconds);
    EXPECT_NEAR(wanderer.Aggro().radius, std::sqrt(50.0f), 1e-5f);
}

TEST_F(WandererTest, ExplicitAggroRangeWins) {
    auto wanderer = Make({}, 3.0f);
    EXPECT_FLOAT_EQ(wanderer.Aggro().radius, 3.0f);
    EXPECT_TRUE(wanderer.Aggro().Contains({3.0f, 0.0f}));
    EXPECT_FALSE(wanderer.Aggro().Contains({3.1f, 0.0f}));
}

TEST_F(WandererTest, IdleTimerCountsDownInTicks) {
    WanderSettings settings;
    settings.minIdleSeconds = 1.0f;
    settings.maxIdleSeconds = 1.0f;
    auto wanderer = Make(settings);

    wanderer.OnTick(std::nullopt);
    EXPECT_EQ(wanderer.State(), BehaviorState::Idle);
    ExpectAt(wanderer.Position(), Vector2{0.0f, 0.0f});

    wanderer.OnTick(std::nullopt);
    EXPECT_EQ(wanderer.State(), BehaviorState::Wandering);
}

TEST_F(WandererTest, WalksToChosenPointThenIdles) {
    auto wanderer = Make();
    rng_.QueueFloat(3.0f);
    rng_.QueueFloat(0.0f);

    wanderer.OnTick(std::nullopt);
    EXPECT_EQ(wanderer.State(), BehaviorState::Wandering);
    ExpectAt(wanderer.WanderTarget(), Vector2{3.0f, 0.0f});
    ExpectAt(wanderer.Position(), Vector2{1.0f, 0.0f});

    wanderer.OnTick(std::nullopt);
    ExpectAt(wanderer.Position(), Vector2{2.0f, 0.0f});

    wanderer.OnTick(std::nullopt);
    ExpectAt(wanderer.Position(), Vector2{3.0f, 0.0f});
    EXPECT_EQ(wanderer.State(), BehaviorState::Idle);
}

TEST_F(WandererTest, RenderPositionInterpolatesInsideWindow) {
    auto wanderer = Make();
    rng_.QueueFloat(3.0f);
    rng_.QueueFloat(0.0f);
    wanderer.OnTick(std::nullopt);

    ExpectAt(wanderer.RenderPosition(), Vector2{0.0f, 0.0f});
    ExpectAt(wanderer.Update(0.25f), Vector2{0.5f, 0.0f});
    ExpectAt(wanderer.Update(0.25f), Vector2{1.0f, 0.0f});
    // Frame updates never change the logical position.
    ExpectAt(wanderer.Position(), Vector2{1.0f, 0.0f});
}

TEST_F(WandererTest, WanderStaysInsideBounds) {
    tcc::foundation::Mt19937RandomSource rng(1234);
    WanderBounds bounds;
    bounds.minOffset = {-2.0f, -3.0f};
    bounds.maxOffset = {4.0f, 1.0f};
    Wanderer wanderer(AgentId(7), {10.0f, 10.0f}, bounds, WanderSettings{}, rng, kTick);

    const Rect rect = wanderer.Bounds();
    for (int i = 0; i < 400; ++i) {
        wanderer.OnTick(std::nullopt);
        const Vector2 p = wanderer.Position();
        EXPECT_GE(p.x, rect.min.x - 1e-4f);
        EXPECT_LE(p.x, rect.max.x + 1e-4f);
        EXPECT_GE(p.y, rect.min.y - 1e-4f);
        EXPECT_LE(p.y, rect.max.y + 1e-4f);
    }
}

TEST_F(WandererTest, ChaseStopsInsideMeleeRange) {
    auto wanderer = Make();
    wanderer.EnterCombat();
    EXPECT_EQ(wanderer.State(), BehaviorState::Approaching);

    const Vector2 target{4.0f, 0.0f};
    wanderer.OnTick(target);
    ExpectAt(wanderer.Position(), Vector2{1.0f, 0.0f});
    EXPECT_EQ(wanderer.State(), BehaviorState::Approaching);

    wanderer.OnTick(target);
    EXPECT_EQ(wanderer.State(), BehaviorState::Approaching);

    wanderer.OnTick(target);
    EXPECT_EQ(wanderer.State(), BehaviorState::Attacking);
    EXPECT_LE(Distance(wanderer.Position(), target), kMeleeRange);
    EXPECT_GT(Distance(wanderer.Position(), target), 1.0f);
}

TEST_F(WandererTest, AttackingHoldsPositionWhileInRange) {
    auto wanderer = Make();
    wanderer.EnterCombat();
    wanderer.OnTick(Vector2{1.0f, 0.0f});
    EXPECT_EQ(wanderer.State(), BehaviorState::Attacking);
    ExpectAt(wanderer.Position(), Vector2{0.0f, 0.0f});
}

TEST_F(WandererTest, ChaseIsClampedToBounds) {
    auto wanderer = Make();
    wanderer.EnterCombat();
    for (int i = 0; i < 20; ++i) {
        wanderer.OnTick(Vector2{20.0f, 0.0f});
    }
    EXPECT_FLOAT_EQ(wanderer.Position().x, 5.0f);
    EXPECT_EQ(wanderer.State(), BehaviorState::Approaching);
}

TEST_F(WandererTest, ReturnHomeAfterCombat) {
    auto wanderer = Make();
    wanderer.EnterCombat();
    wanderer.OnTick(Vector2{4.0f, 0.0f});
    wanderer.OnTick(Vector2{4.0f, 0.0f});
    ExpectAt(wanderer.Position(), Vector2{2.0f, 0.0f});

    wanderer.ExitCombat(true);
    EXPECT_EQ(wanderer.State(), BehaviorState::Returning);

    wanderer.OnTick(std::nullopt);
    ExpectAt(wanderer.Position(), Vector2{1.0f, 0.0f});
    EXPECT_EQ(wanderer.State(), BehaviorState::Returning);

    wanderer.OnTick(std::nullopt);
    ExpectAt(wanderer.Position(), Vector2{0.0f, 0.0f});
    EXPECT_EQ(wanderer.State(), BehaviorState::Idle);
}

TEST_F(WandererTest, ExitWithoutReturnIdlesInPlace) {
    auto wanderer = Make();
    wanderer.EnterCombat();
    wanderer.OnTick(Vector2{4.0f, 0.0f});
    wanderer.ExitCombat(false);

    EXPECT_EQ(wanderer.State(), BehaviorState::Idle);
    ExpectAt(wanderer.Position(), Vector2{1.0f, 0.0f});
}

TEST_F(WandererTest, ResetToOriginSnaps) {
    auto wanderer = Make();
    wanderer.EnterCombat();
    wanderer.OnTick(Vector2{4.0f, 0.0f});
    wanderer.ResetToOrigin();

    EXPECT_EQ(wanderer.State(), BehaviorState::Idle);
    ExpectAt(wanderer.Position(), Vector2{0.0f, 0.0f});
    ExpectAt(wanderer.RenderPosition(), Vector2{0.0f, 0.0f});
}

TEST_F(WandererTest, StateChangesAreObservable) {
    auto wanderer = Make();
    std::vector<std::pair<BehaviorState, BehaviorState>> seen;
    ScopedConnection conn = wanderer.OnStateChanged().connectScoped(
        [&](BehaviorState from, BehaviorState to) { seen.emplace_back(from, to); });

    wanderer.EnterCombat();
    wanderer.OnTick(Vector2{1.0f, 0.0f});
    wanderer.ForceReturnToOrigin();

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].second, BehaviorState::Approaching);
    EXPECT_EQ(seen[1].second, BehaviorState::Attacking);
    EXPECT_EQ(seen[2].first, BehaviorState::Attacking);
    EXPECT_EQ(seen[2].second, BehaviorState::Returning);
}
