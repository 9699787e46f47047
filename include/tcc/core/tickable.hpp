#pragma once

/// @file tickable.hpp
/// @brief ITickable: the subscriber side of the tick scheduler.

namespace tcc {

/// Anything that advances its simulation state once per fixed tick.
///
/// OnTick() is the only place a subscriber may change simulation state.
/// Calls arrive on one logical thread, in subscription order.
class ITickable {
public:
    virtual ~ITickable() = default;

    virtual void OnTick() = 0;
};

} // namespace tcc
