/**
 * @file profile.hpp
 * @brief Lightweight scope timing for the compositor and render loop
 *
 * Sections are identified by name and aggregated flat (no call tree):
 * - RAII guard records the duration of a scope
 * - Per-section call count, total, min and max
 * - printStats() lists sections by descending total time
 *
 * Example usage:
 * @code
 * void CompositorHost::tick() {
 *     PROFILE_SCOPE("CompositorHost::tick");
 *     // ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace Profiling {

/**
 * @brief Process-wide store of timing data.
 *
 * Single-threaded by contract, like the rest of the event loop.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing statistics for one named section
     */
    struct SectionStats {
        Duration total_time{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
        std::uint64_t call_count{0};
    };

    /**
     * @brief Adds one measured duration to a section.
     */
    static void record(const std::string& name, Duration duration);

    /**
     * @brief Returns the statistics of a section, or empty stats if it never ran.
     */
    static SectionStats stats(const std::string& name);

    /**
     * @brief Prints every section to stdout, longest total first.
     */
    static void printStats();

    /**
     * @brief Clears all recorded data.
     */
    static void reset();

private:
    Profiler() = default;

    static Profiler& getInstance();

    std::map<std::string, SectionStats> sections;
};

/**
 * @brief RAII guard timing the enclosing scope.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
    Profiler::TimePoint start_time;
};

} // namespace Profiling

#define MOTION_PROFILE_CONCAT_INNER(a, b) a##b
#define MOTION_PROFILE_CONCAT(a, b) MOTION_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler MOTION_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
