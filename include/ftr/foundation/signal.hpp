#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> observer used to publish travel outcomes.
///
/// Slots are registered with connect() and invoked by emit(). Slots run on a
/// snapshot taken under the lock, so a slot may connect or disconnect other
/// slots (or itself) while the signal is firing.

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace ftr::foundation {

/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<const TransitionReport&> onFinished;
///   auto id = onFinished.connect([](const TransitionReport& r) {
///       std::cout << toString(r.outcome) << "\n";
///   });
///   onFinished.emit(report);
///   onFinished.disconnect(id);
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
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    /// Remove a callback. Unknown ids are ignored.
    void disconnect(SlotId id) {
        std::lock_guard lock(mutex_);
        std::erase_if(slots_, [id](const auto& entry) { return entry.first == id; });
    }

    /// Invoke every connected slot, in connection order.
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& entry : slots_) {
                snapshot.push_back(entry.second);
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
    std::vector<std::pair<SlotId, Slot>> slots_;
    SlotId nextId_ = 1;
    mutable std::mutex mutex_;
};

} // namespace ftr::foundation
