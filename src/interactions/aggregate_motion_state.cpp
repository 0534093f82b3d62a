#include "motion/interactions/aggregate_motion_state.hpp"

#include <algorithm>

namespace Interactions {

AggregateMotionState::AggregateMotionState()
    : aggregate(Motion::MotionState::AtRest)
{
}

AggregateMotionState::~AggregateMotionState() {
    forgetAll();
}

void AggregateMotionState::observe(IStateful& interaction) {
    std::size_t const index = entries.size();
    entries.push_back(Entry{&interaction, 0, false});

    // subscribe() reports the current state synchronously
    entries[index].subscription = interaction.state().subscribe(
        [this, index](const Motion::MotionState& s) {
            entries[index].active = (s == Motion::MotionState::Active);
            refresh();
        });
}

void AggregateMotionState::forgetAll() {
    for (auto& entry : entries) {
        entry.interaction->state().unsubscribe(entry.subscription);
    }
    entries.clear();
    aggregate.set(Motion::MotionState::AtRest);
}

std::size_t AggregateMotionState::activeCount() const {
    return static_cast<std::size_t>(
        std::count_if(entries.begin(), entries.end(), [](const Entry& e) { return e.active; }));
}

void AggregateMotionState::refresh() {
    aggregate.set(activeCount() > 0 ? Motion::MotionState::Active
                                    : Motion::MotionState::AtRest);
}

} // namespace Interactions
