#include "motion/core/debug.hpp"

// Initialize static members
std::uint64_t MotionStats::emitted = 0;
std::uint64_t MotionStats::completed = 0;
std::uint64_t MotionStats::cancelled = 0;
std::uint64_t MotionStats::ticks = 0;
