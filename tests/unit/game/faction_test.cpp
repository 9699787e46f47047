#include <gtest/gtest.h>

#include "tcc/game/faction.hpp"

using namespace tcc::game;

TEST(FactionTableTest, UnknownPairsAreNotHostile) {
    FactionTable table;
    EXPECT_FALSE(table.IsHostile(1, 2));
    EXPECT_EQ(table.PairCount(), 0u);
}

TEST(FactionTableTest, HostilityIsSymmetric) {
    FactionTable table;
    table.SetHostile(3, 1);
    EXPECT_TRUE(table.IsHostile(1, 3));
    EXPECT_TRUE(table.IsHostile(3, 1));
    EXPECT_EQ(table.PairCount(), 1u);

    table.SetHostile(1, 3);
    EXPECT_EQ(table.PairCount(), 1u);
}

TEST(FactionTableTest, HostilityCanBeCleared) {
    FactionTable table;
    table.SetHostile(1, 2);
    table.SetHostile(2, 1, false);
    EXPECT_FALSE(table.IsHostile(1, 2));
}

TEST(FactionTableTest, NeutralAndSelfAreNeverHostile) {
    FactionTable table;
    table.SetHostile(kNeutralFaction, 4);
    table.SetHostile(4, 4);
    EXPECT_FALSE(table.IsHostile(kNeutralFaction, 4));
    EXPECT_FALSE(table.IsHostile(4, 4));
    EXPECT_EQ(table.PairCount(), 0u);
}
