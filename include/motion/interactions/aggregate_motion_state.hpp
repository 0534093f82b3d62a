/**
 * @file aggregate_motion_state.hpp
 * @brief Combines the state of several interactions into one
 */

#pragma once

#include <cstddef>
#include <vector>

#include "motion/core/motion_state.hpp"
#include "motion/core/observable.hpp"
#include "motion/interactions/interaction.hpp"

namespace Interactions {

/**
 * @class AggregateMotionState
 * @brief Active while any observed interaction is active
 *
 * Observed interactions must outlive this object, or be released with
 * forgetAll() before they are destroyed.
 */
class AggregateMotionState {
public:
    AggregateMotionState();
    ~AggregateMotionState();

    AggregateMotionState(const AggregateMotionState&) = delete;
    AggregateMotionState& operator=(const AggregateMotionState&) = delete;

    /**
     * @brief Starts tracking an interaction's state
     */
    void observe(IStateful& interaction);

    /**
     * @brief Unsubscribes from every observed interaction
     */
    void forgetAll();

    Motion::Observable<Motion::MotionState>& state() { return aggregate; }

    /** @brief Number of observed interactions currently active */
    std::size_t activeCount() const;

private:
    struct Entry {
        IStateful* interaction;
        Motion::SubscriptionId subscription;
        bool active;
    };

    void refresh();

    std::vector<Entry> entries;
    Motion::Observable<Motion::MotionState> aggregate;
};

} // namespace Interactions
