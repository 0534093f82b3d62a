/**
 * @file key_path.hpp
 * @brief Animatable property backed by a layer entity
 */

#ifndef MOTION_KEY_PATH_HPP
#define MOTION_KEY_PATH_HPP

#include <algorithm>
#include <iostream>
#include <optional>
#include <utility>

#include <entt/entt.hpp>

#include "motion/animation/i_animatable.hpp"
#include "motion/components/layer.hpp"

namespace Animation {

/**
 * @class KeyPath
 * @brief Binds a spring to the T-valued property of one layer
 *
 * The entity needs ModelValue<T>, PresentationValue<T> and
 * AnimationTrack<T>. Animations added here are advanced by
 * Systems::CompositorSystem<T>. The registry must outlive the key path.
 */
template <typename T>
class KeyPath : public IAnimatableProperty<T> {
public:
    KeyPath(entt::registry& registry, entt::entity entity)
        : registry(registry)
        , entity(entity)
    {
    }

    entt::entity layer() const { return entity; }

    T value() const override {
        if (!isBound()) {
            return T{};
        }
        return registry.get<Components::ModelValue<T>>(entity).value;
    }

    void setValue(const T& value) override {
        if (!isBound()) {
            return;
        }
        registry.get<Components::ModelValue<T>>(entity).value = value;

        // With nothing running the layer shows its model value directly
        if (registry.get<Components::AnimationTrack<T>>(entity).running.empty()) {
            registry.get<Components::PresentationValue<T>>(entity).value = value;
        }
    }

    /**
     * @brief Value currently displayed by the layer
     */
    T presentationValue() const {
        if (!isBound()) {
            return T{};
        }
        return registry.get<Components::PresentationValue<T>>(entity).value;
    }

    void add(const SpringAnimation<T>& animation,
             Motion::AnimationKey key,
             const std::optional<T>& initialVelocity,
             CompletionCallback onComplete) override {
        if (!isBound()) {
            return;
        }
        auto& track = registry.get<Components::AnimationTrack<T>>(entity);
        track.running.push_back(Components::RunningAnimation<T>{
            key, animation, initialVelocity, 0.0, std::move(onComplete)});
    }

    void removeAnimation(Motion::AnimationKey key) override {
        if (!isBound()) {
            return;
        }
        auto& running = registry.get<Components::AnimationTrack<T>>(entity).running;
        running.erase(std::remove_if(running.begin(), running.end(),
                          [key](const Components::RunningAnimation<T>& anim) { return anim.key == key; }),
                      running.end());

        if (running.empty()) {
            registry.get<Components::PresentationValue<T>>(entity).value =
                registry.get<Components::ModelValue<T>>(entity).value;
        }
    }

    /** @brief Number of animations currently running on this property */
    std::size_t runningCount() const {
        if (!isBound()) {
            return 0;
        }
        return registry.get<Components::AnimationTrack<T>>(entity).running.size();
    }

private:
    bool isBound() const {
        if (!registry.valid(entity) ||
            !registry.all_of<Components::ModelValue<T>,
                             Components::PresentationValue<T>,
                             Components::AnimationTrack<T>>(entity)) {
            std::cerr << "[KeyPath] Warning: layer entity is not animatable.\n";
            return false;
        }
        return true;
    }

    entt::registry& registry;
    entt::entity entity;
};

} // namespace Animation

#endif // MOTION_KEY_PATH_HPP
