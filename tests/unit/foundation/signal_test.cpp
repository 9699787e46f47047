#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tcc/foundation/signal.hpp"

using namespace tcc::foundation;

TEST(SignalTest, EmitReachesSlotsInRegistrationOrder) {
    Signal<int> signal;
    std::vector<std::string> calls;

    signal.connect([&](int v) { calls.push_back("a" + std::to_string(v)); });
    signal.connect([&](int v) { calls.push_back("b" + std::to_string(v)); });
    signal.emit(3);

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "a3");
    EXPECT_EQ(calls[1], "b3");
}

TEST(SignalTest, DisconnectById) {
    Signal<> signal;
    int count = 0;
    auto id = signal.connect([&] { ++count; });

    signal.emit();
    signal.disconnect(id);
    signal.emit();

    EXPECT_EQ(count, 1);
    EXPECT_EQ(signal.slotCount(), 0u);
}

TEST(SignalTest, ScopedConnectionDisconnectsOnDestruction) {
    Signal<> signal;
    int count = 0;
    {
        ScopedConnection conn = signal.connectScoped([&] { ++count; });
        EXPECT_TRUE(conn.connected());
        signal.emit();
    }
    signal.emit();

    EXPECT_EQ(count, 1);
    EXPECT_EQ(signal.slotCount(), 0u);
}

TEST(SignalTest, ScopedConnectionMoveKeepsSlot) {
    Signal<> signal;
    int count = 0;
    ScopedConnection outer;
    {
        ScopedConnection inner = signal.connectScoped([&] { ++count; });
        outer = std::move(inner);
        EXPECT_FALSE(inner.connected());  // NOLINT(bugprone-use-after-move)
    }
    signal.emit();
    EXPECT_EQ(count, 1);

    outer.reset();
    signal.emit();
    EXPECT_EQ(count, 1);
}

TEST(SignalTest, ConnectionOutlivingSignalIsInert) {
    ScopedConnection conn;
    {
        Signal<> signal;
        conn = signal.connectScoped([] {});
    }
    // Destroying the handle after the signal must be harmless.
    conn.reset();
    EXPECT_FALSE(conn.connected());
}

TEST(SignalTest, SlotMayDisconnectItselfWhileFiring) {
    Signal<> signal;
    int count = 0;
    ScopedConnection self;
    self = signal.connectScoped([&] {
        ++count;
        self.reset();
    });

    signal.emit();
    signal.emit();
    EXPECT_EQ(count, 1);
}
