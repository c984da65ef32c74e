#include "meter_monitor.hpp"
#include "logger.hpp"
#include <utility>

namespace ut325f {

MeterMonitor::MeterMonitor(std::unique_ptr<FrameReader> reader)
  : _reader(std::move(reader)) {
  if (_reader) {
    _port = _reader->session().address();
    _portOpen = _reader->session().isOpen();
  }
}

MeterMonitor::~MeterMonitor() {
  stop();
}

void MeterMonitor::start() {
  if (!_reader || _running.exchange(true)) {
    return;
  }
  _thread = std::thread(&MeterMonitor::run, this);
}

void MeterMonitor::stop() {
  _running = false;
  if (_thread.joinable()) {
    _thread.join();
  }
}

void MeterMonitor::run() {
  UT325F_LOG_INFO("Read loop started on %s", _port.c_str());

  while (_running) {
    Reading reading;
    ReadStatus status = _reader->readFrame(reading);
    bool open = _reader->session().isOpen();

    {
      std::lock_guard<std::mutex> lock(_dataMtx);
      _stats = _reader->stats();
      _portOpen = open;
      if (status == ReadStatus::Ok) {
        _latest = reading;
      } else {
        _lastError = _reader->lastErrorText();
      }
    }

    if (status == ReadStatus::Ok) {
      continue;
    }

    UT325F_LOG_WARN("Error reading data: %s", _reader->lastErrorText().c_str());

    // A dead port fails instantly; don't spin on it
    if (status == ReadStatus::IoError || status == ReadStatus::NotOpen) {
      HAL::ITimer* timer = _reader->session().timer();
      if (timer) {
        timer->sleepMs(static_cast<int32_t>(_reader->session().ioTimeout().count()));
      }
    }
  }

  UT325F_LOG_INFO("Read loop stopped");
}

std::optional<Reading> MeterMonitor::latestReading() const {
  std::lock_guard<std::mutex> lock(_dataMtx);
  return _latest;
}

ReaderStats MeterMonitor::stats() const {
  std::lock_guard<std::mutex> lock(_dataMtx);
  return _stats;
}

std::string MeterMonitor::lastError() const {
  std::lock_guard<std::mutex> lock(_dataMtx);
  return _lastError;
}

bool MeterMonitor::portOpen() const {
  std::lock_guard<std::mutex> lock(_dataMtx);
  return _portOpen;
}

} // namespace ut325f
