#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ut325f::HAL {

/**
 * @brief Interface for a monotonic system timer.
 */
class ITimer {
public:
  virtual ~ITimer() = default;

  /**
   * @brief Get the monotonic uptime in milliseconds.
   *
   * @return int64_t Milliseconds since an arbitrary fixed origin.
   */
  virtual int64_t getUptimeMs() = 0;

  /**
   * @brief Sleep for a specified number of milliseconds.
   *
   * @param ms Milliseconds to sleep.
   */
  virtual void sleepMs(int32_t ms) = 0;
};

/**
 * @brief Result of a single serial read.
 */
enum class IoStatus {
  Ok,       // All requested bytes were read
  Timeout,  // Timeout elapsed before all bytes arrived
  Closed,   // Port is not open (or was closed by the peer)
  Error     // Any other I/O failure
};

/**
 * @brief Serial line settings.
 *
 * Defaults are the UT325F line parameters (115200 8-N-1, no flow control).
 */
struct SerialSettings {
  enum class Parity : uint8_t { NONE, ODD, EVEN };
  enum class StopBits : uint8_t { ONE, ONE_POINT_FIVE, TWO };
  enum class FlowControl : uint8_t { NONE, SOFTWARE, HARDWARE };

  uint32_t baudRate = 115200;
  uint8_t dataBits = 8;
  Parity parity = Parity::NONE;
  StopBits stopBits = StopBits::ONE;
  FlowControl flowControl = FlowControl::NONE;
};

/**
 * @brief Interface for a byte-oriented serial port.
 *
 * Abstracts the physical port so the frame layer can be driven by a real
 * device (Boost.Asio) or by a scripted simulation in tests.
 */
class ISerialPort {
public:
  virtual ~ISerialPort() = default;

  /**
   * @brief Open and configure the port.
   *
   * @param address Device path (e.g. "/dev/ttyUSB0")
   * @param settings Line settings to apply
   * @param error Output reason on failure
   * @return true on success
   */
  virtual bool open(const std::string& address, const SerialSettings& settings,
                    std::string& error) = 0;

  /**
   * @brief Read exactly len bytes or give up after timeout.
   *
   * Bytes that arrive before a timeout are left in data and counted in
   * transferred; they are not pushed back into the stream.
   *
   * @param data Destination buffer (at least len bytes)
   * @param len Number of bytes wanted
   * @param transferred Output number of bytes actually stored
   * @param timeout Upper bound on the wait
   * @return IoStatus::Ok only if transferred == len
   */
  virtual IoStatus read(uint8_t* data, size_t len, size_t& transferred,
                        std::chrono::milliseconds timeout) = 0;

  /**
   * @brief Close the port. Safe to call when already closed.
   */
  virtual void close() = 0;

  virtual bool isOpen() const = 0;
};

} // namespace ut325f::HAL
