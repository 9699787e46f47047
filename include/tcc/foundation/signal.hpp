#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> observer list with scoped connections.
///
/// Slots run in registration order. A ScopedConnection disconnects its slot
/// when destroyed, and is inert if the signal died first, so observers can
/// tie their subscriptions to their own lifetime without dangling.

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace tcc::foundation {

/// Owning handle for one slot registration.
///
/// Move-only. Destroying or reset()-ing the handle disconnects the slot.
class ScopedConnection {
public:
    ScopedConnection() = default;

    explicit ScopedConnection(std::function<void()> disconnect)
        : disconnect_(std::move(disconnect)) {}

    ~ScopedConnection() { reset(); }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    ScopedConnection(ScopedConnection&& other) noexcept
        : disconnect_(std::exchange(other.disconnect_, nullptr)) {}

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            reset();
            disconnect_ = std::exchange(other.disconnect_, nullptr);
        }
        return *this;
    }

    /// Disconnect now. Safe to call repeatedly.
    void reset() {
        if (disconnect_) {
            auto fn = std::exchange(disconnect_, nullptr);
            fn();
        }
    }

    [[nodiscard]] bool connected() const noexcept { return static_cast<bool>(disconnect_); }

private:
    std::function<void()> disconnect_;
};

/// Observer list dispatching events to registered callbacks.
///
/// @tparam Args The argument types passed to each slot.
///
/// Example:
/// @code
///   Signal<const DeathEvent&> onDeath;
///   ScopedConnection conn = onDeath.connectScoped([](const DeathEvent& e) {
///       dropTable.roll(e.victim);
///   });
///   onDeath.emit(event);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() : state_(std::make_shared<State>()) {}

    // Non-copyable, non-movable: connections refer to this signal's state.
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) = delete;
    Signal& operator=(Signal&&) = delete;

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        std::unique_lock lock(state_->mutex);
        auto id = state_->nextId++;
        state_->slots.emplace(id, std::move(slot));
        return id;
    }

    /// Register a callback whose lifetime is bound to the returned handle.
    [[nodiscard]] ScopedConnection connectScoped(Slot slot) {
        auto id = connect(std::move(slot));
        std::weak_ptr<State> weak = state_;
        return ScopedConnection([weak, id] {
            if (auto state = weak.lock()) {
                std::unique_lock lock(state->mutex);
                state->slots.erase(id);
            }
        });
    }

    /// Remove a previously registered callback by its SlotId.
    void disconnect(SlotId id) {
        std::unique_lock lock(state_->mutex);
        state_->slots.erase(id);
    }

    /// Invoke every registered slot in registration order.
    ///
    /// Slots are snapshotted first, so a slot may connect or disconnect
    /// (itself included) while the signal is firing.
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::shared_lock lock(state_->mutex);
            snapshot.reserve(state_->slots.size());
            for (const auto& [id, slot] : state_->slots) {
                snapshot.push_back(slot);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(state_->mutex);
        return state_->slots.size();
    }

private:
    struct State {
        std::map<SlotId, Slot> slots;
        SlotId nextId = 1;
        mutable std::shared_mutex mutex;
    };

    std::shared_ptr<State> state_;
};

} // namespace tcc::foundation
