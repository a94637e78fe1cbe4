#pragma once

/**
 * @file constants.hpp
 * @brief Unit conversions and gameplay defaults for Voltaic.
 */

namespace voltaic {
namespace constants {

// === Unit Conversion ===
constexpr float MILLI_PER_UNIT = 1000.0f;            // W -> mW, Wh -> mWh
constexpr float SECONDS_PER_HOUR = 3600.0f;

// === Device Defaults ===
constexpr float DEFAULT_WATTAGE = 10.0f;             // W while discharging
constexpr float DEFAULT_STANDBY_WATTAGE = 0.0f;      // W while switched off

// === Store Defaults ===
constexpr float DEFAULT_MAX_CHARGE = 1000.0f;        // mWh
constexpr float DEFAULT_STARTING_CHARGE = 500.0f;    // mWh

// === Simulation ===
constexpr double FIXED_DT = 0.01;                    // 100 Hz tick
constexpr int MAX_STEPS_PER_FRAME = 10;

}  // namespace constants
}  // namespace voltaic
