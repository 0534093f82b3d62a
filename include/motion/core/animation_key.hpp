/**
 * @file animation_key.hpp
 * @brief Opaque handle identifying one submitted animation
 */

#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>

namespace Motion {

/**
 * @brief Process-unique key for an animation added to a layer.
 *
 * Keys are never reused within a process, so several springs may share
 * one layer without colliding.
 */
class AnimationKey {
public:
    /**
     * @brief Returns a key that no previous call has returned
     */
    static AnimationKey generate();

    std::uint64_t value() const { return id; }

    std::string toString() const;

    bool operator==(const AnimationKey& other) const { return id == other.id; }
    bool operator!=(const AnimationKey& other) const { return id != other.id; }
    bool operator<(const AnimationKey& other) const { return id < other.id; }

private:
    explicit AnimationKey(std::uint64_t id) : id(id) {}

    std::uint64_t id;
};

std::ostream& operator<<(std::ostream& os, const AnimationKey& key);

} // namespace Motion

namespace std {

template <>
struct hash<Motion::AnimationKey> {
    std::size_t operator()(const Motion::AnimationKey& key) const noexcept {
        return std::hash<std::uint64_t>()(key.value());
    }
};

} // namespace std
