#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> for dispatching notification server events.
///
/// Slots are registered via connect() and invoked when emit() is called.
/// The slot table is guarded by a mutex; emit() invokes a snapshot outside
/// the lock so a slot may connect or disconnect without deadlocking.

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace gnb::foundation {

/// Observer list dispatching events to registered callbacks.
///
/// Example:
/// @code
///   Signal<GuestId, uint32_t> dismissed;
///   auto id = dismissed.connect([](GuestId gid, uint32_t reason) {
///       sendDismissed(gid, reason);
///   });
///   dismissed.emit(GuestId(2), 1);
///   dismissed.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        std::lock_guard lock(mutex_);
        auto id = nextId_++;
        slots_.emplace(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) {
        std::lock_guard lock(mutex_);
        slots_.erase(id);
    }

    /// Invoke every registered slot, in connection order.
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& [id, slot] : slots_) {
                snapshot.push_back(slot);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::lock_guard lock(mutex_);
        return slots_.size();
    }

private:
    std::map<SlotId, Slot> slots_;
    SlotId nextId_ = 1;
    mutable std::mutex mutex_;
};

} // namespace gnb::foundation
