#pragma once

#include <cstdint>
#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef MOTION_ENABLE_DEBUG
#define MOTION_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef MOTION_DEBUG_LEVEL
#define MOTION_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define MOTION_DEBUG(level, x) do { \
    if (MOTION_ENABLE_DEBUG && (level) <= MOTION_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Counters for spring and compositor activity
class MotionStats {
public:
    static void reset() {
        emitted = 0;
        completed = 0;
        cancelled = 0;
        ticks = 0;
    }

    static void recordEmission() { emitted++; }
    static void recordCompletion() { completed++; }
    static void recordCancellation() { cancelled++; }
    static void recordTick() { ticks++; }

    static std::uint64_t emissions() { return emitted; }
    static std::uint64_t completions() { return completed; }
    static std::uint64_t cancellations() { return cancelled; }

    static void print() {
        std::cout << "Motion stats:\n"
                  << "  Animations emitted:   " << emitted << "\n"
                  << "  Animations completed: " << completed << "\n"
                  << "  Animations cancelled: " << cancelled << "\n"
                  << "  Compositor ticks:     " << ticks << "\n";
    }

private:
    static std::uint64_t emitted;
    static std::uint64_t completed;
    static std::uint64_t cancelled;
    static std::uint64_t ticks;
};
