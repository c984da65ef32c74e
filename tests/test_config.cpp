#include <unity.h>
#include "config.hpp"
#include <string>
#include <vector>

using namespace ut325f;

void setUp(void) {}
void tearDown(void) {}

// argv-style wrapper around string literals
static ArgsResult parse(std::vector<std::string> args, MeterConfig& config, std::string& error,
                        bool allowHttp = false) {
  args.insert(args.begin(), "ut325f");
  std::vector<char*> argv;
  for (auto& a : args) argv.push_back(a.data());
  return parseArgs(static_cast<int>(argv.size()), argv.data(), allowHttp, config, error);
}

void test_defaults(void) {
  MeterConfig config;
  TEST_ASSERT_EQUAL_UINT32(115200, config.baudRate);
  TEST_ASSERT_EQUAL_UINT32(1000, config.ioTimeoutMs);
  TEST_ASSERT_EQUAL_UINT32(5000, config.syncTimeoutMs);
  TEST_ASSERT_EQUAL_UINT32(5000, config.payloadTimeoutMs);
  TEST_ASSERT_FALSE(config.heldTemps);
  TEST_ASSERT_EQUAL_STRING("Serial port not set", config.validate().c_str());
}

void test_port_and_held_flag(void) {
  MeterConfig config;
  std::string error;
  TEST_ASSERT_EQUAL_INT((int)ArgsResult::Ok, (int)parse({"/dev/ttyUSB0", "-H"}, config, error));
  TEST_ASSERT_EQUAL_STRING("/dev/ttyUSB0", config.port.c_str());
  TEST_ASSERT_TRUE(config.heldTemps);

  MeterConfig longForm;
  TEST_ASSERT_EQUAL_INT((int)ArgsResult::Ok,
                        (int)parse({"--held-temps", "/dev/ttyUSB1"}, longForm, error));
  TEST_ASSERT_TRUE(longForm.heldTemps);
  TEST_ASSERT_EQUAL_STRING("/dev/ttyUSB1", longForm.port.c_str());
}

void test_timeouts(void) {
  MeterConfig config;
  std::string error;
  TEST_ASSERT_EQUAL_INT((int)ArgsResult::Ok,
                        (int)parse({"--sync-timeout", "2500", "--payload-timeout", "800",
                                    "--io-timeout", "200", "/dev/ttyUSB0"}, config, error));
  TEST_ASSERT_EQUAL_UINT32(2500, config.syncTimeoutMs);
  TEST_ASSERT_EQUAL_UINT32(800, config.payloadTimeoutMs);
  TEST_ASSERT_EQUAL_UINT32(200, config.ioTimeoutMs);
}

void test_errors(void) {
  std::string error;
  {
    MeterConfig config;
    TEST_ASSERT_EQUAL_INT((int)ArgsResult::Error, (int)parse({}, config, error));
    TEST_ASSERT_EQUAL_STRING("Serial port not set", error.c_str());
  }
  {
    MeterConfig config;
    TEST_ASSERT_EQUAL_INT((int)ArgsResult::Error, (int)parse({"--bogus", "/dev/x"}, config, error));
    TEST_ASSERT_EQUAL_STRING("Unknown option: --bogus", error.c_str());
  }
  {
    MeterConfig config;
    TEST_ASSERT_EQUAL_INT((int)ArgsResult::Error, (int)parse({"/dev/x", "--sync-timeout", "soon"}, config, error));
  }
  {
    MeterConfig config;
    TEST_ASSERT_EQUAL_INT((int)ArgsResult::Error, (int)parse({"/dev/x", "--io-timeout"}, config, error));
    TEST_ASSERT_EQUAL_STRING("Missing value for --io-timeout", error.c_str());
  }
  {
    MeterConfig config;
    TEST_ASSERT_EQUAL_INT((int)ArgsResult::Error, (int)parse({"/dev/x", "--sync-timeout", "0"}, config, error));
  }
  {
    MeterConfig config;
    TEST_ASSERT_EQUAL_INT((int)ArgsResult::Error, (int)parse({"/dev/x", "/dev/y"}, config, error));
  }
}

void test_http_options_only_for_server(void) {
  std::string error;
  MeterConfig cli;
  TEST_ASSERT_EQUAL_INT((int)ArgsResult::Error,
                        (int)parse({"/dev/x", "--http-port", "9000"}, cli, error));

  MeterConfig server;
  TEST_ASSERT_EQUAL_INT((int)ArgsResult::Ok,
                        (int)parse({"/dev/x", "--http-port", "9000", "--listen", "127.0.0.1"},
                                   server, error, true));
  TEST_ASSERT_EQUAL_INT(9000, server.httpPort);
  TEST_ASSERT_EQUAL_STRING("127.0.0.1", server.httpHost.c_str());

  MeterConfig bad;
  TEST_ASSERT_EQUAL_INT((int)ArgsResult::Error,
                        (int)parse({"/dev/x", "--http-port", "70000"}, bad, error, true));
}

void test_help(void) {
  MeterConfig config;
  std::string error;
  TEST_ASSERT_EQUAL_INT((int)ArgsResult::Help, (int)parse({"--help"}, config, error));
  TEST_ASSERT_TRUE(usage("ut325f", false).find("--held-temps") != std::string::npos);
  TEST_ASSERT_TRUE(usage("ut325f", false).find("--http-port") == std::string::npos);
  TEST_ASSERT_TRUE(usage("ut325f-server", true).find("--http-port") != std::string::npos);
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_defaults);
  RUN_TEST(test_port_and_held_flag);
  RUN_TEST(test_timeouts);
  RUN_TEST(test_errors);
  RUN_TEST(test_http_options_only_for_server);
  RUN_TEST(test_help);
  return UNITY_END();
}
