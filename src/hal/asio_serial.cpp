#include "asio_serial.hpp"

namespace ut325f::HAL {

using boost::asio::serial_port_base;

AsioSerialPort::AsioSerialPort() : _port(_io), _timer(_io) {}

AsioSerialPort::~AsioSerialPort() {
  close();
}

bool AsioSerialPort::open(const std::string& address, const SerialSettings& settings,
                          std::string& error) {
  close();

  boost::system::error_code ec;
  _port.open(address, ec);
  if (ec) {
    error = "Failed to open serial port '" + address + "': " + ec.message();
    return false;
  }

  if (!applySettings(settings, ec)) {
    error = "Failed to configure serial port '" + address + "': " + ec.message();
    close();
    return false;
  }

  _lastError.clear();
  return true;
}

bool AsioSerialPort::applySettings(const SerialSettings& settings,
                                   boost::system::error_code& ec) {
  serial_port_base::parity::type parity = serial_port_base::parity::none;
  switch (settings.parity) {
    case SerialSettings::Parity::ODD:  parity = serial_port_base::parity::odd; break;
    case SerialSettings::Parity::EVEN: parity = serial_port_base::parity::even; break;
    default: break;
  }

  serial_port_base::stop_bits::type stopBits = serial_port_base::stop_bits::one;
  switch (settings.stopBits) {
    case SerialSettings::StopBits::ONE_POINT_FIVE: stopBits = serial_port_base::stop_bits::onepointfive; break;
    case SerialSettings::StopBits::TWO:            stopBits = serial_port_base::stop_bits::two; break;
    default: break;
  }

  serial_port_base::flow_control::type flow = serial_port_base::flow_control::none;
  switch (settings.flowControl) {
    case SerialSettings::FlowControl::SOFTWARE: flow = serial_port_base::flow_control::software; break;
    case SerialSettings::FlowControl::HARDWARE: flow = serial_port_base::flow_control::hardware; break;
    default: break;
  }

  _port.set_option(serial_port_base::baud_rate(settings.baudRate), ec);
  if (ec) return false;
  _port.set_option(serial_port_base::character_size(settings.dataBits), ec);
  if (ec) return false;
  _port.set_option(serial_port_base::parity(parity), ec);
  if (ec) return false;
  _port.set_option(serial_port_base::stop_bits(stopBits), ec);
  if (ec) return false;
  _port.set_option(serial_port_base::flow_control(flow), ec);
  return !ec;
}

IoStatus AsioSerialPort::read(uint8_t* data, size_t len, size_t& transferred,
                              std::chrono::milliseconds timeout) {
  transferred = 0;
  if (!_port.is_open()) {
    return IoStatus::Closed;
  }
  if (len == 0) {
    return IoStatus::Ok;
  }

  boost::system::error_code readError = boost::asio::error::would_block;
  bool timedOut = false;

  _io.restart();

  boost::asio::async_read(_port, boost::asio::buffer(data, len),
    [&](const boost::system::error_code& ec, size_t n) {
      readError = ec;
      transferred = n;
      _timer.cancel();
    });

  _timer.expires_after(timeout);
  _timer.async_wait([&](const boost::system::error_code& ec) {
    if (ec) return;  // cancelled because the read finished
    timedOut = true;
    boost::system::error_code ignored;
    _port.cancel(ignored);
  });

  _io.run();

  if (!readError) {
    return IoStatus::Ok;
  }
  if (timedOut) {
    return IoStatus::Timeout;
  }

  _lastError = readError.message();
  if (readError == boost::asio::error::eof) {
    return IoStatus::Closed;
  }
  return IoStatus::Error;
}

void AsioSerialPort::close() {
  if (!_port.is_open()) {
    return;
  }
  boost::system::error_code ec;
  _port.cancel(ec);
  _port.close(ec);
}

} // namespace ut325f::HAL
