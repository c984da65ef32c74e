#pragma once

#include "hal.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <string>

namespace ut325f::HAL {

/**
 * @brief Serial port implementation over boost::asio::serial_port.
 *
 * Each read races an async_read against a steady_timer on a private
 * io_context; whichever finishes first cancels the other. The port is only
 * ever driven from the calling thread.
 */
class AsioSerialPort : public ISerialPort {
public:
  AsioSerialPort();
  ~AsioSerialPort() override;

  AsioSerialPort(const AsioSerialPort&) = delete;
  AsioSerialPort& operator=(const AsioSerialPort&) = delete;

  bool open(const std::string& address, const SerialSettings& settings,
            std::string& error) override;
  IoStatus read(uint8_t* data, size_t len, size_t& transferred,
                std::chrono::milliseconds timeout) override;
  void close() override;
  bool isOpen() const override { return _port.is_open(); }

  // Message of the last non-timeout read failure
  const std::string& lastError() const { return _lastError; }

private:
  boost::asio::io_context _io;
  boost::asio::serial_port _port;
  boost::asio::steady_timer _timer;
  std::string _lastError;

  bool applySettings(const SerialSettings& settings, boost::system::error_code& ec);
};

} // namespace ut325f::HAL
