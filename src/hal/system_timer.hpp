#pragma once

#include "hal.hpp"
#include <chrono>
#include <thread>

namespace ut325f::HAL {

/**
 * @brief Timer HAL implementation over std::chrono::steady_clock.
 */
class SystemTimer : public ITimer {
public:
  SystemTimer() : origin(std::chrono::steady_clock::now()) {}

  int64_t getUptimeMs() override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - origin).count();
  }

  void sleepMs(int32_t ms) override {
    if (ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
  }

private:
  std::chrono::steady_clock::time_point origin;
};

} // namespace ut325f::HAL
