#include "config.hpp"
#include <charconv>
#include <string_view>

namespace ut325f {

static bool parseNumber(std::string_view text, uint32_t& out) {
  if (text.empty()) return false;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

ArgsResult parseArgs(int argc, char** argv, bool allowHttp, MeterConfig& config,
                     std::string& error) {
  for (int i = 1; i < argc; i++) {
    std::string_view arg = argv[i];

    // Options that take a value
    auto value = [&](std::string_view& out) {
      if (i + 1 >= argc) {
        error = "Missing value for " + std::string(arg);
        return false;
      }
      out = argv[++i];
      return true;
    };
    auto numberValue = [&](uint32_t& out) {
      std::string_view text;
      if (!value(text)) return false;
      if (!parseNumber(text, out)) {
        error = "Invalid number for " + std::string(arg) + ": " + std::string(text);
        return false;
      }
      return true;
    };

    if (arg == "-h" || arg == "--help") {
      return ArgsResult::Help;
    } else if (arg == "-H" || arg == "--held-temps") {
      config.heldTemps = true;
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg == "--sync-timeout") {
      if (!numberValue(config.syncTimeoutMs)) return ArgsResult::Error;
    } else if (arg == "--payload-timeout") {
      if (!numberValue(config.payloadTimeoutMs)) return ArgsResult::Error;
    } else if (arg == "--io-timeout") {
      if (!numberValue(config.ioTimeoutMs)) return ArgsResult::Error;
    } else if (allowHttp && arg == "--listen") {
      std::string_view host;
      if (!value(host)) return ArgsResult::Error;
      config.httpHost = std::string(host);
    } else if (allowHttp && arg == "--http-port") {
      uint32_t port = 0;
      if (!numberValue(port)) return ArgsResult::Error;
      config.httpPort = port > 65535 ? 0 : static_cast<int>(port);
    } else if (arg.starts_with("-")) {
      error = "Unknown option: " + std::string(arg);
      return ArgsResult::Error;
    } else if (config.port.empty()) {
      config.port = std::string(arg);
    } else {
      error = "Unexpected argument: " + std::string(arg);
      return ArgsResult::Error;
    }
  }

  error = config.validate();
  return error.empty() ? ArgsResult::Ok : ArgsResult::Error;
}

std::string usage(const char* program, bool allowHttp) {
  std::string text = "Usage: " + std::string(program) + " [options] <port>\n"
    "\n"
    "Read temperatures from a UNI-T UT325F thermometer on a serial port.\n"
    "\n"
    "Options:\n"
    "  -H, --held-temps         Also print the hold type and held temperatures\n"
    "  --sync-timeout MS        Give up looking for a frame start after MS (default 5000)\n"
    "  --payload-timeout MS     Give up reading a started frame after MS (default 5000)\n"
    "  --io-timeout MS          Timeout of a single serial read (default 1000)\n"
    "  -v, --verbose            Debug logging\n"
    "  -h, --help               Show this help\n";
  if (allowHttp) {
    text +=
      "  --listen HOST            HTTP listen address (default 0.0.0.0)\n"
      "  --http-port N            HTTP port (default 8080)\n";
  }
  return text;
}

} // namespace ut325f
