/**
 * @file main.cpp
 * @brief Entry point for the spring demo.
 *
 * Click anywhere to send the square to a random point; R recenters it.
 */

#include "motion/core/demo_manager.hpp"

int main() {
    DemoManager demo;
    return demo.run();
}
