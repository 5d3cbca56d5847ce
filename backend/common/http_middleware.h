#ifndef CANDIDATE_REGISTRY_HTTP_MIDDLEWARE_H
#define CANDIDATE_REGISTRY_HTTP_MIDDLEWARE_H

#include <atomic>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <httplib.h>

#include "logger.h"

namespace middleware {

class MetricsRegistry {
 public:
  static MetricsRegistry &Instance() {
    static MetricsRegistry instance;
    return instance;
  }

  void RecordRequest(std::string_view service, std::string_view method, int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &service_bucket = request_totals_[std::string(service)];
    service_bucket[{std::string(method), status}] += 1;
  }

  void RecordRejection(std::string_view service, std::string_view kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    rejections_[std::string(service)][std::string(kind)] += 1;
  }

  std::string Render(std::string_view service) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto service_key = std::string(service);
    std::ostringstream oss;
    oss << "# HELP service_request_total Total HTTP requests handled by the service" << '\n';
    oss << "# TYPE service_request_total counter" << '\n';
    if (auto it = request_totals_.find(service_key); it != request_totals_.end()) {
      for (const auto &entry : it->second) {
        const auto &method = std::get<0>(entry.first);
        const auto status = std::get<1>(entry.first);
        oss << "service_request_total{service=\"" << service_key << "\",method=\"" << method
            << "\",status=\"" << status << "\"} " << entry.second << '\n';
      }
    }
    oss << "# HELP service_rejections_total Candidate submissions rejected by kind" << '\n';
    oss << "# TYPE service_rejections_total counter" << '\n';
    if (auto it = rejections_.find(service_key); it != rejections_.end()) {
      for (const auto &entry : it->second) {
        oss << "service_rejections_total{service=\"" << service_key << "\",kind=\""
            << entry.first << "\"} " << entry.second << '\n';
      }
    }
    return oss.str();
  }

 private:
  using RequestKey = std::tuple<std::string, int>;

  MetricsRegistry() = default;

  std::mutex mutex_;
  std::map<std::string, std::map<RequestKey, long long>> request_totals_;
  std::map<std::string, std::map<std::string, long long>> rejections_;
};

inline void LogEvent(std::string_view service, std::string_view category, std::string_view message,
                     std::string_view context = {}) {
  logging::ServiceLogger::Instance(service).Log(category, message, context);
}

inline std::string RequestId(const httplib::Request &req) {
  if (auto value = req.get_header_value("X-Request-Id"); !value.empty()) {
    return value;
  }
  static std::atomic<unsigned long long> counter{0};
  std::ostringstream oss;
  oss << "generated-" << std::hex << std::hash<std::string>{}(req.method + ' ' + req.path) << '-'
      << std::dec << ++counter;
  return oss.str();
}

inline void ConfigureServer(httplib::Server &server, std::string_view service_name) {
  const std::string service(service_name);
  server.set_logger([service](const httplib::Request &req, const httplib::Response &res) {
    std::ostringstream oss;
    oss << req.method << ' ' << req.path << " -> " << res.status;
    const auto request_id = RequestId(req);
    LogEvent(service, "http", oss.str(), request_id);
    MetricsRegistry::Instance().RecordRequest(service, req.method, res.status);
    if (res.status >= 500) {
      std::ostringstream error_oss;
      error_oss << "HTTP error " << req.method << ' ' << req.path << " -> " << res.status;
      LogEvent(service, "error", error_oss.str(), request_id);
    }
  });

  server.set_exception_handler(
      [service](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string message = "unknown";
        if (ep) {
          try {
            std::rethrow_exception(ep);
          } catch (const std::exception &ex) {
            message = ex.what();
          } catch (...) {
            message = "non-standard exception";
          }
        }
        std::ostringstream oss;
        oss << "Exception handling " << req.method << ' ' << req.path << ": " << message;
        LogEvent(service, "error", oss.str(), RequestId(req));
        res.status = 500;
        res.set_content(R"({"error":"internal_server_error"})", "application/json");
      });
}

inline void AttachStandardHandlers(httplib::Server &server, std::string_view service_name) {
  ConfigureServer(server, service_name);
  const std::string service(service_name);
  server.set_error_handler([service](const httplib::Request &req, httplib::Response &res) {
    std::ostringstream oss;
    oss << "Error handler invoked for " << req.method << ' ' << req.path << " -> " << res.status;
    LogEvent(service, "warn", oss.str(), RequestId(req));
    if (res.body.empty()) {
      const std::string code = res.status == 404   ? "not_found"
                               : res.status == 413 ? "payload_too_large"
                                                   : "request_failed";
      res.set_content("{\"error\":\"" + code + "\"}", "application/json");
    }
  });
}

inline void ExposeMetrics(httplib::Server &server, std::string_view service_name) {
  const std::string service(service_name);
  server.Get("/metrics", [service](const httplib::Request &, httplib::Response &res) {
    res.set_content(MetricsRegistry::Instance().Render(service),
                    "text/plain; version=0.0.4; charset=utf-8");
  });
}

}  // namespace middleware

#endif  // CANDIDATE_REGISTRY_HTTP_MIDDLEWARE_H
