#pragma once
#include <cstdarg>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ut325f {

enum class LogLevel {
  ERROR = 0,
  WARN  = 1,
  INFO  = 2,
  DEBUG = 3
};

class RingBufferLogger {
public:
  // Singleton access
  static RingBufferLogger& instance();

  void init(size_t sizeBytes);

  void setLevel(LogLevel level);
  LogLevel getLevel() const;

  // When false, entries are only kept in the ring buffer
  void setConsoleEnabled(bool enabled);

  void log(LogLevel level, std::string_view message);

  void error(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
  void warn(const char* fmt, ...)  __attribute__((format(printf, 2, 3)));
  void info(const char* fmt, ...)  __attribute__((format(printf, 2, 3)));
  void debug(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

  // Dump buffer to a callback (e.g., for the HTTP API), oldest first
  template<typename Func>
  void dump(Func consumer) {
    std::lock_guard<std::mutex> lock(mtx);
    if (buffer.empty()) return;
    size_t start = full ? head : 0;
    size_t count = full ? buffer.size() : head;

    for (size_t i = 0; i < count; ++i) {
      consumer(buffer[(start + i) % buffer.size()]);
    }
  }

  std::string contents();

private:
  RingBufferLogger() = default;

  void logFormatted(LogLevel level, const char* fmt, va_list args);

  mutable std::mutex mtx;
  std::vector<char> buffer;
  size_t head = 0;
  bool full = false;
  LogLevel currentLevel = LogLevel::INFO;
  bool console = true;
};

} // namespace ut325f

#define UT325F_LOG_ERROR(...) ::ut325f::RingBufferLogger::instance().error(__VA_ARGS__)
#define UT325F_LOG_WARN(...)  ::ut325f::RingBufferLogger::instance().warn(__VA_ARGS__)
#define UT325F_LOG_INFO(...)  ::ut325f::RingBufferLogger::instance().info(__VA_ARGS__)
#define UT325F_LOG_DEBUG(...) ::ut325f::RingBufferLogger::instance().debug(__VA_ARGS__)
