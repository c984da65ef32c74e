#pragma once

#include <cstdint>
#include <string>

namespace ut325f {

/**
 * @brief Runtime configuration for the meter reader programs.
 *
 * Filled from the command line. The transport I/O timeout and the frame
 * reader deadlines are separate settings: one bounds a single serial read,
 * the others bound a whole synchronization or payload phase.
 */
struct MeterConfig {
  // Transport
  std::string port;               // e.g. "/dev/ttyUSB0"
  uint32_t baudRate = 115200;
  uint32_t ioTimeoutMs = 1000;    // per serial read

  // Garbage discard pass after open
  uint32_t discardReads = 10;
  uint32_t discardPauseMs = 100;

  // Frame reader deadlines
  uint32_t syncTimeoutMs = 5000;
  uint32_t payloadTimeoutMs = 5000;

  // Output
  bool heldTemps = false;         // print hold type and held channels too
  bool verbose = false;

  // HTTP monitor
  std::string httpHost = "0.0.0.0";
  int httpPort = 8080;

  /**
   * @brief Validate configuration
   *
   * @return Empty string if valid, error message otherwise
   */
  std::string validate() const {
    if (port.empty()) {
      return "Serial port not set";
    }
    if (baudRate == 0) {
      return "Baud rate must be positive";
    }
    if (ioTimeoutMs == 0) {
      return "I/O timeout must be positive";
    }
    if (syncTimeoutMs == 0 || payloadTimeoutMs == 0) {
      return "Frame timeouts must be positive";
    }
    if (httpPort < 1 || httpPort > 65535) {
      return "HTTP port must be in 1..65535";
    }
    return "";  // Valid
  }
};

enum class ArgsResult {
  Ok,
  Help,   // usage was requested
  Error
};

/**
 * @brief Parse command line options into config.
 *
 * @param allowHttp Accept --listen and --http-port
 * @param error Output message when ArgsResult::Error is returned
 */
ArgsResult parseArgs(int argc, char** argv, bool allowHttp, MeterConfig& config,
                     std::string& error);

std::string usage(const char* program, bool allowHttp);

} // namespace ut325f
