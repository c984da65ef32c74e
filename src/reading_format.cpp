#include "reading_format.hpp"
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace ut325f {

static void appendTimestamp(std::string& out, const Reading& reading) {
  char buf[32];
  snprintf(buf, sizeof(buf), "%.3f", reading.unixSeconds());
  out += buf;
}

static void appendTemps(std::string& out, const std::array<float, Reading::NUM_CHANNELS>& temps) {
  char buf[32];
  for (float t : temps) {
    snprintf(buf, sizeof(buf), " %7.3f", static_cast<double>(t));
    out += buf;
  }
}

std::string formatCurrent(const Reading& reading) {
  std::string line;
  appendTimestamp(line, reading);
  appendTemps(line, reading.currentTemps);
  return line;
}

std::string formatAll(const Reading& reading) {
  std::string line;
  appendTimestamp(line, reading);
  appendTemps(line, reading.currentTemps);
  line += " ";
  line += holdTypeToString(reading.holdType);
  appendTemps(line, reading.heldTemps);
  return line;
}

static void writeTemp(std::ostringstream& json, float t) {
  if (std::isfinite(t)) {
    json << std::setprecision(9) << t;
  } else {
    json << "null";
  }
}

static void writeTempArray(std::ostringstream& json, const std::array<float, Reading::NUM_CHANNELS>& temps) {
  json << "[";
  for (size_t i = 0; i < temps.size(); i++) {
    if (i > 0) json << ", ";
    writeTemp(json, temps[i]);
  }
  json << "]";
}

std::string toJson(const Reading& reading) {
  std::ostringstream json;
  json << "{\n";
  json << "  \"timestamp\": " << std::fixed << std::setprecision(6) << reading.unixSeconds() << ",\n";
  json << std::defaultfloat;
  json << "  \"currentTemps\": ";
  writeTempArray(json, reading.currentTemps);
  json << ",\n";
  json << "  \"holdType\": \"" << holdTypeToString(reading.holdType) << "\",\n";
  json << "  \"heldTemps\": ";
  writeTempArray(json, reading.heldTemps);
  json << ",\n";
  json << "  \"meterTemp\": ";
  writeTemp(json, reading.meterTemp);
  json << "\n";
  json << "}\n";
  return json.str();
}

std::string statsToJson(const ReaderStats& stats) {
  std::ostringstream json;
  json << "{";
  json << "\"frames\": " << stats.frames << ", ";
  json << "\"syncTimeouts\": " << stats.syncTimeouts << ", ";
  json << "\"payloadTimeouts\": " << stats.payloadTimeouts << ", ";
  json << "\"ioErrors\": " << stats.ioErrors << ", ";
  json << "\"decodeErrors\": " << stats.decodeErrors << ", ";
  json << "\"discardedBytes\": " << stats.discardedBytes;
  json << "}";
  return json.str();
}

std::string escapeJson(const std::string& str) {
  std::ostringstream escaped;
  for (char c : str) {
    switch (c) {
      case '"':  escaped << "\\\""; break;
      case '\\': escaped << "\\\\"; break;
      case '\n': escaped << "\\n"; break;
      case '\r': escaped << "\\r"; break;
      case '\t': escaped << "\\t"; break;
      default:   escaped << c; break;
    }
  }
  return escaped.str();
}

} // namespace ut325f
