#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace LP::UI {

using ConnectionId = std::uint64_t;

/**
 * Signal: ordered list of slots invoked synchronously by emit().
 *
 * Slots may connect or disconnect (including themselves) while an emission is
 * in progress. A slot disconnected mid-emission is not called afterwards; a slot
 * connected mid-emission first runs on the next emit().
 */
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;

    Signal() = default;

    Signal(Signal const&)            = delete;
    Signal& operator=(Signal const&) = delete;

    auto connect(Slot slot) -> ConnectionId {
        auto id = next_id_++;
        slots_.push_back(Entry{id, std::make_shared<Slot>(std::move(slot))});
        return id;
    }

    auto disconnect(ConnectionId id) -> bool {
        for (auto it = slots_.begin(); it != slots_.end(); ++it) {
            if (it->id == id) {
                slots_.erase(it);
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] auto connected(ConnectionId id) const -> bool {
        for (auto const& entry : slots_) {
            if (entry.id == id) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] auto slot_count() const -> std::size_t { return slots_.size(); }

    auto emit(Args... args) const -> void {
        auto snapshot = slots_;
        for (auto const& entry : snapshot) {
            if (!connected(entry.id)) {
                continue;
            }
            if (*entry.slot) {
                (*entry.slot)(args...);
            }
        }
    }

private:
    struct Entry {
        ConnectionId          id;
        std::shared_ptr<Slot> slot;
    };

    std::vector<Entry> slots_;
    ConnectionId       next_id_ = 1;
};

} // namespace LP::UI
