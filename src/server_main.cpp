/*
 * UT325F HTTP monitor
 *
 * Reads the meter on a background thread and serves the latest reading,
 * read statistics and the log over HTTP.
 */

#include "api_server.hpp"
#include "config.hpp"
#include "frame_reader.hpp"
#include "hal/asio_serial.hpp"
#include "hal/system_timer.hpp"
#include "logger.hpp"
#include "meter_monitor.hpp"
#include "meter_session.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

// Header-only library: https://github.com/yhirose/cpp-httplib
#include <httplib.h>

using namespace ut325f;

static httplib::Server* g_server = nullptr;

static void signalHandler(int) {
  if (g_server) {
    g_server->stop();
  }
}

// Translate an httplib request into the backend-agnostic API types
static void forward(ApiServer& api, const char* method, const httplib::Request& req,
                    httplib::Response& res) {
  HttpRequest apiReq;
  apiReq.method = method;
  apiReq.path = req.path;
  apiReq.body = req.body;
  for (const auto& [key, value] : req.params) {
    apiReq.params[key] = value;
  }

  HttpResponse apiRes;
  api.handleRequest(apiReq, apiRes);

  std::string contentType = "application/json";
  if (apiRes.headers.count("Content-Type")) {
    contentType = apiRes.headers["Content-Type"];
  }
  res.set_content(apiRes.body, contentType.c_str());
  res.status = apiRes.status;
}

int main(int argc, char** argv) {
  MeterConfig config;
  std::string error;

  switch (parseArgs(argc, argv, true, config, error)) {
    case ArgsResult::Help:
      std::cout << usage(argv[0], true);
      return 0;
    case ArgsResult::Error:
      std::cerr << error << "\n\n" << usage(argv[0], true);
      return 2;
    case ArgsResult::Ok:
      break;
  }

  auto& log = RingBufferLogger::instance();
  log.init(1024 * 1024);
  log.setLevel(config.verbose ? LogLevel::DEBUG : LogLevel::INFO);
  log.info("UT325F monitor starting");

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

  MeterMonitor monitor(std::make_unique<FrameReader>(std::move(session), deadlines));
  monitor.start();

  ApiServer api(&monitor);
  api.registerRoutes();

  httplib::Server svr;
  g_server = &svr;

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  svr.Get("/api/reading", [&](const httplib::Request& req, httplib::Response& res) {
    forward(api, "GET", req, res);
  });

  svr.Get("/api/status", [&](const httplib::Request& req, httplib::Response& res) {
    forward(api, "GET", req, res);
  });

  svr.Get("/api/log", [&](const httplib::Request& req, httplib::Response& res) {
    forward(api, "GET", req, res);
  });

  log.info("Serving http://%s:%d", config.httpHost.c_str(), config.httpPort);

  bool listened = svr.listen(config.httpHost.c_str(), config.httpPort);
  g_server = nullptr;

  monitor.stop();

  if (!listened) {
    log.error("Failed to listen on %s:%d", config.httpHost.c_str(), config.httpPort);
    return 1;
  }
  log.info("UT325F monitor stopped");
  return 0;
}
