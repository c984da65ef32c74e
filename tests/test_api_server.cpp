#include <unity.h>
#include "api_server.hpp"
#include "frames.hpp"
#include "logger.hpp"
#include "meter_monitor.hpp"
#include "sim_hal.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace ut325f;
using namespace ut325f::test;

static SimTimer* timer;
static SimSerialPort* port;
static MeterMonitor* monitor;
static ApiServer* api;

void setUp(void) {
  auto& log = RingBufferLogger::instance();
  log.init(16 * 1024);
  log.setConsoleEnabled(false);
  log.setLevel(LogLevel::INFO);

  timer = new SimTimer();
  auto simPort = std::make_unique<SimSerialPort>(timer);
  port = simPort.get();

  MeterSession::Options options;
  options.discardReads = 0;
  auto session = std::make_unique<MeterSession>(std::move(simPort), timer, options);
  session->open("/dev/ttyUSB0");

  monitor = new MeterMonitor(std::make_unique<FrameReader>(std::move(session)));
  api = new ApiServer(monitor);
  api->registerRoutes();
}

void tearDown(void) {
  delete api;
  delete monitor;
  delete timer;
  api = nullptr;
  monitor = nullptr;
  timer = nullptr;
  port = nullptr;
}

static HttpResponse get(const std::string& path) {
  HttpRequest req;
  req.method = "GET";
  req.path = path;
  HttpResponse res;
  api->handleRequest(req, res);
  return res;
}

// Wall-clock wait for the loop thread; the simulated port never blocks
static bool waitForReading() {
  for (int i = 0; i < 500; i++) {
    if (monitor->latestReading()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

void test_reading_not_available_before_first_frame(void) {
  HttpResponse res = get("/api/reading");
  TEST_ASSERT_EQUAL_INT(404, res.status);
  TEST_ASSERT_TRUE(res.body.find("No reading yet") != std::string::npos);
}

void test_unknown_route(void) {
  TEST_ASSERT_EQUAL_INT(404, get("/api/nothing").status);

  HttpRequest req;
  req.method = "POST";
  req.path = "/api/reading";
  HttpResponse res;
  api->handleRequest(req, res);
  TEST_ASSERT_EQUAL_INT(404, res.status);
}

void test_status_before_start(void) {
  HttpResponse res = get("/api/status");
  TEST_ASSERT_EQUAL_INT(200, res.status);
  TEST_ASSERT_EQUAL_STRING("application/json", res.headers["Content-Type"].c_str());
  TEST_ASSERT_TRUE(res.body.find("\"port\": \"/dev/ttyUSB0\"") != std::string::npos);
  TEST_ASSERT_TRUE(res.body.find("\"open\": true") != std::string::npos);
  TEST_ASSERT_TRUE(res.body.find("\"running\": false") != std::string::npos);
}

void test_latest_reading_served(void) {
  port->feed(capturedFrame());
  monitor->start();
  TEST_ASSERT_TRUE(waitForReading());
  monitor->stop();

  HttpResponse res = get("/api/reading");
  TEST_ASSERT_EQUAL_INT(200, res.status);
  TEST_ASSERT_TRUE(res.body.find("\"holdType\": \"Current\"") != std::string::npos);
  TEST_ASSERT_TRUE(res.body.find("\"meterTemp\": 26.3125") != std::string::npos);

  HttpResponse status = get("/api/status");
  TEST_ASSERT_TRUE(status.body.find("\"frames\": 1") != std::string::npos);
  TEST_ASSERT_TRUE(status.body.find("\"running\": false") != std::string::npos);
}

void test_log_route(void) {
  RingBufferLogger::instance().info("marker %d", 42);
  HttpResponse res = get("/api/log");
  TEST_ASSERT_EQUAL_INT(200, res.status);
  TEST_ASSERT_EQUAL_STRING("text/plain", res.headers["Content-Type"].c_str());
  TEST_ASSERT_TRUE(res.body.find("marker 42") != std::string::npos);
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_reading_not_available_before_first_frame);
  RUN_TEST(test_unknown_route);
  RUN_TEST(test_status_before_start);
  RUN_TEST(test_latest_reading_served);
  RUN_TEST(test_log_route);
  return UNITY_END();
}
