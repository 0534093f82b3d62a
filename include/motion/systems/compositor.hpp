/**
 * @file compositor.hpp
 * @brief System that advances running spring animations
 *
 * This system handles, for every layer property of type T:
 * - Advancing each running animation by one tick
 * - Retiring animations whose duration has elapsed
 * - Recomputing the presentation value from the newest running animation,
 *   or from the model value when nothing runs
 * - Invoking completions of retired animations after all layers are updated
 *
 * Required components:
 * - ModelValue<T>
 * - PresentationValue<T>
 * - AnimationTrack<T>
 *
 * Optional singleton:
 * - CompositorClock (time scale)
 */

#ifndef MOTION_COMPOSITOR_SYSTEM_HPP
#define MOTION_COMPOSITOR_SYSTEM_HPP

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

#include "motion/animation/i_animatable.hpp"
#include "motion/components/layer.hpp"
#include "motion/core/debug.hpp"
#include "motion/core/profile.hpp"
#include "motion/systems/i_system.hpp"

namespace Systems {

template <typename T>
class CompositorSystem : public ISystem {
public:
    CompositorSystem() = default;
    ~CompositorSystem() override = default;

    void update(entt::registry& registry) override {
        PROFILE_SCOPE("CompositorSystem");

        double timeScale = sysConfig.TimeScale;
        auto clockView = registry.view<Components::CompositorClock>();
        if (!clockView.empty()) {
            timeScale *= registry.get<Components::CompositorClock>(clockView.front()).timeScale;
        }
        double const dt = sysConfig.SecondsPerTick * timeScale;

        std::vector<Animation::CompletionCallback> finished;

        auto view = registry.view<Components::ModelValue<T>,
                                  Components::PresentationValue<T>,
                                  Components::AnimationTrack<T>>();

        for (auto [entity, model, presentation, track] : view.each()) {
            auto& running = track.running;

            for (auto& anim : running) {
                anim.elapsed += dt;
            }

            auto done = std::stable_partition(running.begin(), running.end(),
                [](const Components::RunningAnimation<T>& anim) {
                    return anim.elapsed < anim.animation.duration;
                });
            for (auto it = done; it != running.end(); ++it) {
                finished.push_back(std::move(it->onComplete));
            }
            running.erase(done, running.end());

            if (running.empty()) {
                presentation.value = model.value;
            } else {
                const auto& newest = running.back();
                presentation.value = newest.animation.valueAt(newest.elapsed, newest.initialVelocity);
            }
        }

        if (!finished.empty()) {
            MOTION_DEBUG(DEBUG_LEVEL_VERBOSE,
                "CompositorSystem: " << finished.size() << " animation(s) finished\n");
        }

        // Completions may add or remove animations, so they run last
        for (auto& onComplete : finished) {
            if (onComplete) {
                onComplete();
            }
        }
    }

    void setSystemConfig(const SystemConfig& config) override {
        sysConfig = config;
    }

private:
    SystemConfig sysConfig;
};

} // namespace Systems

#endif // MOTION_COMPOSITOR_SYSTEM_HPP
