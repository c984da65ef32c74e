/*
 * UT325F command line reader
 *
 * Prints one line per frame read from the meter until interrupted.
 */

#include "config.hpp"
#include "frame_reader.hpp"
#include "hal/asio_serial.hpp"
#include "hal/system_timer.hpp"
#include "logger.hpp"
#include "meter_session.hpp"
#include "reading_format.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

using namespace ut325f;

static std::atomic<bool> g_stop{false};

static void signalHandler(int) {
  g_stop = true;
}

int main(int argc, char** argv) {
  MeterConfig config;
  std::string error;

  switch (parseArgs(argc, argv, false, config, error)) {
    case ArgsResult::Help:
      std::cout << usage(argv[0], false);
      return 0;
    case ArgsResult::Error:
      std::cerr << error << "\n\n" << usage(argv[0], false);
      return 2;
    case ArgsResult::Ok:
      break;
  }

  auto& log = RingBufferLogger::instance();
  log.init(64 * 1024);
  log.setLevel(config.verbose ? LogLevel::DEBUG : LogLevel::WARN);

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  HAL::SystemTimer timer;

  MeterSession::Options options;
  options.ioTimeout = std::chrono::milliseconds(config.ioTimeoutMs);
  options.discardReads = config.discardReads;
  options.discardPause = std::chrono::milliseconds(config.discardPauseMs);

  auto session = std::make_unique<MeterSession>(std::make_unique<HAL::AsioSerialPort>(),
                                                &timer, options);
  if (!session->open(config.port)) {
    std::cerr << session->lastError() << std::endl;
    return 1;
  }

  FrameReader::Deadlines deadlines;
  deadlines.sync = std::chrono::milliseconds(config.syncTimeoutMs);
  deadlines.payload = std::chrono::milliseconds(config.payloadTimeoutMs);
  FrameReader reader(std::move(session), deadlines);

  while (!g_stop) {
    Reading reading;
    ReadStatus status = reader.readFrame(reading);
    if (status == ReadStatus::Ok) {
      std::cout << (config.heldTemps ? formatAll(reading) : formatCurrent(reading)) << std::endl;
    } else if (!g_stop) {
      std::cerr << "Error reading data: " << reader.lastErrorText() << std::endl;
    }
  }

  reader.session().close();
  return 0;
}
