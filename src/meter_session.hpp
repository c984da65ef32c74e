/*
 * UT325F transport session
 * Owns the serial connection to the meter and provides bounded reads
 */

#pragma once

#include "hal/hal.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ut325f {

class MeterSession {
public:
  struct Options {
    std::chrono::milliseconds ioTimeout{1000};     // per serial read
    uint32_t discardReads = 10;                    // reads performed right after open
    std::chrono::milliseconds discardPause{100};   // pause after each discard read
  };

  MeterSession(std::unique_ptr<HAL::ISerialPort> port, HAL::ITimer* timer);
  MeterSession(std::unique_ptr<HAL::ISerialPort> port, HAL::ITimer* timer,
               const Options& options);
  ~MeterSession();

  MeterSession(const MeterSession&) = delete;
  MeterSession& operator=(const MeterSession&) = delete;

  /**
   * @brief Open the meter at 115200 8-N-1 and flush stale bytes.
   *
   * @return false if the port cannot be opened or configured; see lastError()
   */
  bool open(const std::string& address);

  /**
   * @brief Read exactly n bytes.
   *
   * Waits at most the I/O timeout, or the smaller timeout given. Bytes that
   * arrived before a timeout stay in data and are counted in transferred.
   */
  HAL::IoStatus readExact(uint8_t* data, size_t n, size_t& transferred);
  HAL::IoStatus readExact(uint8_t* data, size_t n, size_t& transferred,
                          std::chrono::milliseconds timeout);

  // Idempotent; also done on destruction
  void close();

  bool isOpen() const { return _port && _port->isOpen(); }
  const std::string& address() const { return _address; }
  const std::string& lastError() const { return _lastError; }
  std::chrono::milliseconds ioTimeout() const { return _options.ioTimeout; }
  HAL::ITimer* timer() const { return _timer; }

private:
  std::unique_ptr<HAL::ISerialPort> _port;
  HAL::ITimer* _timer;
  Options _options;
  std::string _address;
  std::string _lastError;

  void discardStaleBytes();
};

} // namespace ut325f
