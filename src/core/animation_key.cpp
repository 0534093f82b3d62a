#include "motion/core/animation_key.hpp"

#include <ostream>

namespace Motion {

AnimationKey AnimationKey::generate() {
    static std::uint64_t next = 0;
    return AnimationKey(++next);
}

std::string AnimationKey::toString() const {
    return "spring-" + std::to_string(id);
}

std::ostream& operator<<(std::ostream& os, const AnimationKey& key) {
    return os << key.toString();
}

} // namespace Motion
