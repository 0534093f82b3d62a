/**
 * @file observable.hpp
 * @brief Push-based value cell with explicit observer registration
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>

namespace Motion {

using SubscriptionId = std::uint64_t;

/**
 * @class Observable
 * @brief Holds a value and notifies registered observers when it changes.
 *
 * Subscribing delivers the current value immediately. Setting a value equal
 * to the current one is silent. Observers are notified in subscription
 * order; an observer may unsubscribe itself or others during notification.
 */
template <typename T>
class Observable {
public:
    using Observer = std::function<void(const T&)>;

    explicit Observable(T initial) : current(std::move(initial)) {}

    const T& value() const { return current; }

    /**
     * @brief Registers an observer and immediately sends it the current value
     * @return Id to pass to unsubscribe()
     */
    SubscriptionId subscribe(Observer observer) {
        SubscriptionId const id = ++lastId;
        observers.emplace(id, std::move(observer));

        // The map entry may be erased by the callback itself
        Observer first = observers.at(id);
        first(current);
        return id;
    }

    /**
     * @return true if the id was subscribed
     */
    bool unsubscribe(SubscriptionId id) {
        return observers.erase(id) > 0;
    }

    void set(const T& next) {
        if (next == current) {
            return;
        }
        current = next;

        // Copy so observers can (un)subscribe while being notified
        auto const snapshot = observers;
        for (const auto& [id, observer] : snapshot) {
            if (observers.count(id) > 0) {
                observer(current);
            }
        }
    }

    std::size_t observerCount() const { return observers.size(); }

private:
    T current;
    SubscriptionId lastId = 0;
    std::map<SubscriptionId, Observer> observers;
};

} // namespace Motion
