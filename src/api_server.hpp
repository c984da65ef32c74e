#pragma once

#include "logger.hpp"
#include "meter_monitor.hpp"
#include "reading_format.hpp"
#include <functional>
#include <map>
#include <sstream>
#include <string>

namespace ut325f {

/**
 * @brief HTTP Request structure
 */
struct HttpRequest {
  std::string method;  // GET, POST, ...
  std::string path;
  std::map<std::string, std::string> params;
  std::string body;
};

/**
 * @brief HTTP Response structure
 */
struct HttpResponse {
  int status = 200;
  std::map<std::string, std::string> headers;
  std::string body;

  void setJson(const std::string& json) {
    headers["Content-Type"] = "application/json";
    body = json;
  }

  void setText(const std::string& text) {
    headers["Content-Type"] = "text/plain";
    body = text;
  }

  void setError(int code, const std::string& message) {
    status = code;
    setJson("{\"error\": \"" + escapeJson(message) + "\"}");
  }
};

/**
 * @brief REST API for the meter monitor.
 *
 * Backend-agnostic: the HTTP library only translates its own request and
 * response types to and from these.
 */
class ApiServer {
public:
  using Handler = std::function<void(const HttpRequest&, HttpResponse&)>;

  explicit ApiServer(const MeterMonitor* monitor) : monitor(monitor) {}

  /**
   * @brief Register all API routes
   */
  void registerRoutes() {
    routes["GET:/api/reading"] = [this](const HttpRequest& req, HttpResponse& res) {
      handleGetReading(req, res);
    };

    routes["GET:/api/status"] = [this](const HttpRequest& req, HttpResponse& res) {
      handleGetStatus(req, res);
    };

    routes["GET:/api/log"] = [](const HttpRequest&, HttpResponse& res) {
      res.setText(RingBufferLogger::instance().contents());
    };
  }

  /**
   * @brief Dispatch request to appropriate handler
   */
  void handleRequest(const HttpRequest& req, HttpResponse& res) {
    auto it = routes.find(req.method + ":" + req.path);
    if (it == routes.end()) {
      res.setError(404, "Not found");
      return;
    }
    it->second(req, res);
  }

private:
  const MeterMonitor* monitor;
  std::map<std::string, Handler> routes;

  void handleGetReading(const HttpRequest&, HttpResponse& res) {
    auto reading = monitor->latestReading();
    if (!reading) {
      res.setError(404, "No reading yet");
      return;
    }
    res.setJson(toJson(*reading));
  }

  void handleGetStatus(const HttpRequest&, HttpResponse& res) {
    std::ostringstream json;
    json << "{\n";
    json << "  \"port\": \"" << escapeJson(monitor->port()) << "\",\n";
    json << "  \"open\": " << (monitor->portOpen() ? "true" : "false") << ",\n";
    json << "  \"running\": " << (monitor->isRunning() ? "true" : "false") << ",\n";
    json << "  \"stats\": " << statsToJson(monitor->stats()) << ",\n";
    json << "  \"lastError\": \"" << escapeJson(monitor->lastError()) << "\"\n";
    json << "}\n";
    res.setJson(json.str());
  }
};

} // namespace ut325f
