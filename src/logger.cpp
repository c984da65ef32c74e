#include "logger.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace ut325f {

// Fixed-size formatting buffer for a single entry
static constexpr size_t MAX_MESSAGE_LEN = 512;

RingBufferLogger& RingBufferLogger::instance() {
  static RingBufferLogger inst;
  return inst;
}

void RingBufferLogger::init(size_t sizeBytes) {
  {
    std::lock_guard<std::mutex> lock(mtx);
    buffer.assign(sizeBytes, '\0');
    head = 0;
    full = false;
  }
  debug("Logger initialized with %zu bytes.", sizeBytes);
}

void RingBufferLogger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mtx);
  currentLevel = level;
}

LogLevel RingBufferLogger::getLevel() const {
  std::lock_guard<std::mutex> lock(mtx);
  return currentLevel;
}

void RingBufferLogger::setConsoleEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mtx);
  console = enabled;
}

void RingBufferLogger::log(LogLevel level, std::string_view message) {
  static const char LEVEL_TAGS[] = {'E', 'W', 'I', 'D'};

  // Get UTC Time
  auto now = std::chrono::system_clock::now();
  char timeBuf[32];
  time_t t = std::chrono::system_clock::to_time_t(now);
  struct tm utc;
  gmtime_r(&t, &utc);
  strftime(timeBuf, sizeof(timeBuf), "[%Y-%m-%dT%H:%M:%SZ] ", &utc);

  std::string entry = std::string(timeBuf);
  entry += LEVEL_TAGS[static_cast<int>(level)];
  entry += ": ";
  entry += message;
  entry += "\n";

  std::lock_guard<std::mutex> lock(mtx);
  if (static_cast<int>(level) > static_cast<int>(currentLevel)) {
    return;
  }

  if (console) {
    std::fputs(entry.c_str(), stderr);
  }

  // Store in Ring Buffer
  if (buffer.empty()) return;
  for (char c : entry) {
    buffer[head] = c;
    head = (head + 1) % buffer.size();
    if (head == 0) full = true;
  }
}

void RingBufferLogger::logFormatted(LogLevel level, const char* fmt, va_list args) {
  char msg[MAX_MESSAGE_LEN];
  int n = vsnprintf(msg, sizeof(msg), fmt, args);
  if (n < 0) {
    log(level, "formatting error");
    return;
  }
  log(level, msg);
}

void RingBufferLogger::error(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  logFormatted(LogLevel::ERROR, fmt, args);
  va_end(args);
}

void RingBufferLogger::warn(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  logFormatted(LogLevel::WARN, fmt, args);
  va_end(args);
}

void RingBufferLogger::info(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  logFormatted(LogLevel::INFO, fmt, args);
  va_end(args);
}

void RingBufferLogger::debug(const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  logFormatted(LogLevel::DEBUG, fmt, args);
  va_end(args);
}

std::string RingBufferLogger::contents() {
  std::string out;
  dump([&out](char c) { out.push_back(c); });
  return out;
}

} // namespace ut325f
