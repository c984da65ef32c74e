#pragma once

#include "hal/hal.hpp"
#include <cstdint>
#include <deque>
#include <initializer_list>
#include <string>
#include <vector>

namespace ut325f::test {

/**
 * @brief Timer HAL implementation for simulation.
 *
 * Time only moves when the simulated port waits out a timeout or when
 * someone sleeps.
 */
class SimTimer : public HAL::ITimer {
public:
  int64_t getUptimeMs() override { return nowMs; }

  void sleepMs(int32_t ms) override {
    if (ms > 0) nowMs += ms;
  }

  void advance(int64_t ms) { nowMs += ms; }

private:
  int64_t nowMs = 0;
};

/**
 * @brief Serial port HAL implementation that replays a script.
 *
 * The script is a queue of byte runs, gaps and failures. A read takes bytes
 * until it has enough; hitting a gap (or the end of the script) costs the
 * full read timeout on the SimTimer and returns IoStatus::Timeout with
 * whatever was collected so far.
 */
class SimSerialPort : public HAL::ISerialPort {
public:
  explicit SimSerialPort(SimTimer* timer) : timer(timer) {}

  // --- Script building ---
  void feed(const std::vector<uint8_t>& bytes) {
    if (!bytes.empty()) events.push_back({Event::Kind::BYTES, bytes, 0});
  }

  void feed(std::initializer_list<uint8_t> bytes) { feed(std::vector<uint8_t>(bytes)); }

  void gap(int count = 1) {
    for (int i = 0; i < count; i++) events.push_back({Event::Kind::GAP, {}, 0});
  }

  void fail() { events.push_back({Event::Kind::FAIL, {}, 0}); }

  void failOpenWith(const std::string& message) { openError = message; }

  // --- Inspection ---
  size_t pendingBytes() const {
    size_t n = 0;
    for (const auto& e : events) {
      if (e.kind == Event::Kind::BYTES) n += e.data.size() - e.pos;
    }
    return n;
  }

  int openCount() const { return opens; }
  int closeCount() const { return closes; }
  int readCount() const { return reads; }
  const HAL::SerialSettings& lastSettings() const { return settings; }
  const std::string& lastAddress() const { return address; }

  // --- HAL::ISerialPort ---
  bool open(const std::string& addr, const HAL::SerialSettings& s, std::string& error) override {
    address = addr;
    settings = s;
    opens++;
    if (!openError.empty()) {
      error = openError;
      return false;
    }
    isOpenFlag = true;
    return true;
  }

  HAL::IoStatus read(uint8_t* data, size_t len, size_t& transferred,
                     std::chrono::milliseconds timeout) override {
    transferred = 0;
    reads++;
    if (!isOpenFlag) return HAL::IoStatus::Closed;

    while (transferred < len) {
      if (events.empty()) {
        timer->advance(timeout.count());
        return HAL::IoStatus::Timeout;
      }

      Event& e = events.front();
      switch (e.kind) {
        case Event::Kind::BYTES:
          while (transferred < len && e.pos < e.data.size()) {
            data[transferred++] = e.data[e.pos++];
          }
          if (e.pos == e.data.size()) events.pop_front();
          break;
        case Event::Kind::GAP:
          events.pop_front();
          timer->advance(timeout.count());
          return HAL::IoStatus::Timeout;
        case Event::Kind::FAIL:
          events.pop_front();
          return HAL::IoStatus::Error;
      }
    }
    return HAL::IoStatus::Ok;
  }

  void close() override {
    if (isOpenFlag) closes++;
    isOpenFlag = false;
  }

  bool isOpen() const override { return isOpenFlag; }

private:
  struct Event {
    enum class Kind { BYTES, GAP, FAIL };
    Kind kind;
    std::vector<uint8_t> data;
    size_t pos;
  };

  SimTimer* timer;
  std::deque<Event> events;
  std::string openError;
  std::string address;
  HAL::SerialSettings settings;
  bool isOpenFlag = false;
  int opens = 0;
  int closes = 0;
  int reads = 0;
};

} // namespace ut325f::test
