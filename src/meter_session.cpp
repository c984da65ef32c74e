#include "meter_session.hpp"
#include "frame_decoder.hpp"
#include "logger.hpp"
#include <algorithm>
#include <array>
#include <utility>

namespace ut325f {

MeterSession::MeterSession(std::unique_ptr<HAL::ISerialPort> port, HAL::ITimer* timer)
  : MeterSession(std::move(port), timer, Options()) {}

MeterSession::MeterSession(std::unique_ptr<HAL::ISerialPort> port, HAL::ITimer* timer,
                           const Options& options)
  : _port(std::move(port)), _timer(timer), _options(options) {}

MeterSession::~MeterSession() {
  close();
}

bool MeterSession::open(const std::string& address) {
  close();
  _address = address;
  _lastError.clear();

  if (!_port) {
    _lastError = "No serial port backend";
    return false;
  }

  HAL::SerialSettings settings;  // UT325F defaults: 115200 8-N-1, no flow control
  std::string error;
  if (!_port->open(address, settings, error)) {
    _lastError = error;
    UT325F_LOG_ERROR("%s", error.c_str());
    return false;
  }

  UT325F_LOG_INFO("Opened %s at %u baud", address.c_str(), settings.baudRate);
  discardStaleBytes();
  return true;
}

// The meter may be mid-frame when we attach; read and drop a few frames'
// worth of bytes before the frame reader starts looking for sync.
void MeterSession::discardStaleBytes() {
  std::array<uint8_t, frame::FRAME_SIZE> scratch;
  size_t dropped = 0;

  for (uint32_t i = 0; i < _options.discardReads; i++) {
    size_t n = 0;
    HAL::IoStatus status = readExact(scratch.data(), scratch.size(), n);
    dropped += n;

    if (status == HAL::IoStatus::Closed) {
      UT325F_LOG_WARN("Initial read error: port closed");
      break;
    }
    if (status == HAL::IoStatus::Error) {
      UT325F_LOG_WARN("Initial read error on %s", _address.c_str());
    }

    if (_timer) {
      _timer->sleepMs(static_cast<int32_t>(_options.discardPause.count()));
    }
  }

  UT325F_LOG_DEBUG("Discarded %zu stale bytes", dropped);
}

HAL::IoStatus MeterSession::readExact(uint8_t* data, size_t n, size_t& transferred) {
  return readExact(data, n, transferred, _options.ioTimeout);
}

HAL::IoStatus MeterSession::readExact(uint8_t* data, size_t n, size_t& transferred,
                                      std::chrono::milliseconds timeout) {
  transferred = 0;
  if (!isOpen()) {
    return HAL::IoStatus::Closed;
  }
  return _port->read(data, n, transferred, std::min(timeout, _options.ioTimeout));
}

void MeterSession::close() {
  if (isOpen()) {
    _port->close();
    UT325F_LOG_INFO("Closed %s", _address.c_str());
  }
}

} // namespace ut325f
