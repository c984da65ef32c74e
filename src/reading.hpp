#pragma once

#include <array>
#include <chrono>
#include <cstdint>

namespace ut325f {

/**
 * @brief Which value set the meter has latched in its "held" channels.
 *
 * Selected on the meter's front panel; the wire code is the enum value.
 */
enum class HoldType : uint8_t {
  CURRENT = 0,
  MAXIMUM = 1,
  MINIMUM = 2,
  AVERAGE = 3
};

/**
 * @brief One decoded measurement frame.
 *
 * A channel whose sensor reported an error holds NaN.
 */
struct Reading {
  static constexpr int NUM_CHANNELS = 4;

  std::chrono::system_clock::time_point captureTime;  // stamped locally at decode
  std::array<float, NUM_CHANNELS> currentTemps{};     // Celsius
  std::array<float, NUM_CHANNELS> heldTemps{};        // Celsius
  HoldType holdType = HoldType::CURRENT;
  float meterTemp = 0.0f;                             // meter internal, Celsius

  /**
   * @brief Capture time as fractional seconds since the Unix epoch.
   */
  double unixSeconds() const {
    auto since = captureTime.time_since_epoch();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(since).count();
    return static_cast<double>(us) / 1e6;
  }
};

// Maps a wire code to HoldType; false for anything outside 0..3
bool holdTypeFromCode(uint8_t code, HoldType& out);

const char* holdTypeToString(HoldType type);

} // namespace ut325f
