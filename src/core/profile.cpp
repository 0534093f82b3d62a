/**
 * @file profile.cpp
 * @brief Implementation of the scope timing declared in profile.hpp
 */

#include "motion/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>
#include <vector>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::record(const std::string& name, Duration duration) {
    auto& section = getInstance().sections[name];

    section.total_time += duration;
    section.call_count += 1;
    section.min_time = std::min(section.min_time, duration);
    section.max_time = std::max(section.max_time, duration);
}

Profiler::SectionStats Profiler::stats(const std::string& name) {
    const auto& sections = getInstance().sections;
    auto it = sections.find(name);
    if (it == sections.end()) {
        return SectionStats{};
    }
    return it->second;
}

void Profiler::printStats() {
    const auto& sections = getInstance().sections;
    if (sections.empty()) {
        return;
    }

    std::vector<std::pair<std::string, SectionStats>> sorted(sections.begin(), sections.end());
    std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a.second.total_time > b.second.total_time;
    });

    std::cout << "\nProfiling Statistics:\n";
    for (const auto& [name, s] : sorted) {
        double const totalMs = std::chrono::duration<double, std::milli>(s.total_time).count();
        double const avgUs = s.call_count > 0
            ? std::chrono::duration<double, std::micro>(s.total_time).count() / static_cast<double>(s.call_count)
            : 0.0;

        std::cout << "  " << std::left << std::setw(32) << name
                  << " [" << s.call_count << " calls] "
                  << std::fixed << std::setprecision(2) << totalMs << "ms total, "
                  << avgUs << "us avg\n";
    }
}

void Profiler::reset() {
    getInstance().sections.clear();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
    , start_time(Profiler::Clock::now())
{
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::record(section_name,
                     std::chrono::duration_cast<Profiler::Duration>(Profiler::Clock::now() - start_time));
}

} // namespace Profiling
