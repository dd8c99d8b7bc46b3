#pragma once

#include <longpress/ui/Signal.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace LP::UI {

/**
 * Property: named value with change notification.
 *
 * Observers receive (old, new) and are only notified on an actual change.
 * observe()/unobserve() are const so a read-only reference is enough to watch
 * a property the owner alone may set.
 */
template <typename T>
class Property {
public:
    using ChangedSlot = typename Signal<T const&, T const&>::Slot;

    Property(std::string_view name, T default_value)
        : name_(name), default_(default_value), value_(std::move(default_value)) {}

    Property(Property const&)            = delete;
    Property& operator=(Property const&) = delete;

    [[nodiscard]] auto name() const -> std::string_view { return name_; }
    [[nodiscard]] auto get() const -> T const& { return value_; }
    [[nodiscard]] auto default_value() const -> T const& { return default_; }

    auto set(T value) -> bool {
        if (value == value_) {
            return false;
        }
        auto previous = std::exchange(value_, std::move(value));
        changed_.emit(previous, value_);
        return true;
    }

    auto reset() -> bool { return set(default_); }

    auto observe(ChangedSlot slot) const -> ConnectionId { return changed_.connect(std::move(slot)); }
    auto unobserve(ConnectionId id) const -> bool { return changed_.disconnect(id); }

private:
    std::string                        name_;
    T                                  default_;
    T                                  value_;
    mutable Signal<T const&, T const&> changed_;
};

} // namespace LP::UI
