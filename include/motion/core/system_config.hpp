#pragma once

/**
 * @struct SystemConfig
 * @brief Timing parameters shared by all compositor systems.
 */
struct SystemConfig {
    double SecondsPerTick = 1.0 / 120.0;
    double TimeScale = 1.0;
};
