#pragma once

#include "frame_reader.hpp"
#include "reading.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace ut325f {

/**
 * @brief Runs the frame read loop on its own thread.
 *
 * The monitor owns the reader (and through it the serial session); only the
 * loop thread touches them. Everything other threads can see is copied out
 * under a mutex.
 */
class MeterMonitor {
public:
  explicit MeterMonitor(std::unique_ptr<FrameReader> reader);
  ~MeterMonitor();

  MeterMonitor(const MeterMonitor&) = delete;
  MeterMonitor& operator=(const MeterMonitor&) = delete;

  void start();

  // Returns once the loop thread has exited (at most one frame deadline)
  void stop();

  bool isRunning() const { return _running; }

  /**
   * @brief Returns a copy of the most recently decoded reading.
   * Thread-safe.
   */
  std::optional<Reading> latestReading() const;

  ReaderStats stats() const;
  std::string lastError() const;
  bool portOpen() const;
  const std::string& port() const { return _port; }

private:
  std::unique_ptr<FrameReader> _reader;
  std::string _port;
  std::atomic<bool> _running{false};
  std::thread _thread;

  mutable std::mutex _dataMtx;
  std::optional<Reading> _latest;
  ReaderStats _stats;
  std::string _lastError;
  bool _portOpen = false;

  void run();
};

} // namespace ut325f
