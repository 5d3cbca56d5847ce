#ifndef CANDIDATE_REGISTRY_LOGGER_H
#define CANDIDATE_REGISTRY_LOGGER_H

#include <chrono>
#include <cstdlib>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace logging {

enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

namespace detail {

inline std::string EscapeJson(std::string_view value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const char ch : value) {
    switch (ch) {
      case '"':
        escaped += "\\\"";
        break;
      case '\\':
        escaped += "\\\\";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buffer[7];
          std::snprintf(buffer, sizeof(buffer), "\\u%04x", ch);
          escaped += buffer;
        } else {
          escaped += ch;
        }
        break;
    }
  }
  return escaped;
}

inline std::string FormatTimestamp(std::chrono::system_clock::time_point point) {
  using clock = std::chrono::system_clock;
  const auto seconds = clock::to_time_t(point);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &seconds);
#else
  gmtime_r(&seconds, &tm);
#endif
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()) % 1000;
  if (ms.count() < 0) {
    ms += std::chrono::milliseconds(1000);
  }
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
      << ms.count() << 'Z';
  return oss.str();
}

inline std::string TimestampNow() {
  return FormatTimestamp(std::chrono::system_clock::now());
}

inline std::string SanitizeServiceName(std::string_view service) {
  std::string sanitized;
  sanitized.reserve(service.size());
  for (const char ch : service) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
        ch == '_' || ch == '-') {
      sanitized += ch;
    } else {
      sanitized += '_';
    }
  }
  if (sanitized.empty()) {
    sanitized = "service";
  }
  return sanitized;
}

inline std::string_view LevelName(Level level) {
  switch (level) {
    case Level::kDebug:
      return "debug";
    case Level::kInfo:
      return "info";
    case Level::kWarn:
      return "warn";
    case Level::kError:
      return "error";
  }
  return "info";
}

// Categories that are not level names ("http", "audit") log at info.
inline Level LevelForCategory(std::string_view category) {
  if (category == "debug") {
    return Level::kDebug;
  }
  if (category == "warn") {
    return Level::kWarn;
  }
  if (category == "error") {
    return Level::kError;
  }
  return Level::kInfo;
}

inline Level ParseLevel(const char *value, Level fallback) {
  if (value == nullptr || *value == '\0') {
    return fallback;
  }
  const std::string_view text(value);
  if (text == "debug") {
    return Level::kDebug;
  }
  if (text == "info") {
    return Level::kInfo;
  }
  if (text == "warn" || text == "warning") {
    return Level::kWarn;
  }
  if (text == "error") {
    return Level::kError;
  }
  return fallback;
}

inline Level MinimumLevel() {
  static const Level level = ParseLevel(std::getenv("LOG_LEVEL"), Level::kInfo);
  return level;
}

inline bool ConsoleEnabled() {
  static const bool enabled = [] {
    const char *env = std::getenv("LOG_CONSOLE");
    return env == nullptr || std::string_view(env) != "0";
  }();
  return enabled;
}

inline const std::filesystem::path &LogDirectoryPath() {
  static std::once_flag flag;
  static std::filesystem::path directory;
  std::call_once(flag, []() {
    if (const char *env = std::getenv("LOG_DIRECTORY"); env && *env) {
      directory = env;
    } else {
      directory = "logs";
    }
    if (!directory.is_absolute()) {
      directory = std::filesystem::current_path() / directory;
    }
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
  });
  return directory;
}

inline std::filesystem::path LogFilePath(std::string_view service_key) {
  return LogDirectoryPath() / (std::string(service_key) + ".log");
}

inline std::filesystem::path ErrorLogFilePath() {
  return LogDirectoryPath() / "errors.log";
}

inline std::string BuildLogEntry(std::string_view timestamp, std::string_view service,
                                 std::string_view category, std::string_view message,
                                 std::string_view context) {
  std::ostringstream oss;
  oss << "{\"timestamp\":\"" << EscapeJson(timestamp) << "\",\"service\":\"" << EscapeJson(service)
      << "\",\"category\":\"" << EscapeJson(category) << "\",\"message\":\"" << EscapeJson(message)
      << "\"";
  if (!context.empty()) {
    oss << ",\"context\":\"" << EscapeJson(context) << "\"";
  }
  oss << '}';
  return oss.str();
}

inline void AppendLogEntry(const std::filesystem::path &path, const std::string &entry) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream stream(path, std::ios::app);
  if (!stream.is_open()) {
    return;
  }
  stream << entry << '\n';
}

inline std::mutex &LogMutex() {
  static std::mutex mutex;
  return mutex;
}

inline void EmitConsole(std::string_view service, std::string_view category,
                        std::string_view message, std::string_view context) {
  std::clog << '[' << service << "] " << category << ": " << message;
  if (!context.empty()) {
    std::clog << " (" << context << ")";
  }
  std::clog << std::endl;
}

}  // namespace detail

class ServiceLogger {
 public:
  static ServiceLogger &Instance(std::string_view service_name) {
    std::string name = service_name.empty() ? "service" : std::string(service_name);
    const auto key = detail::SanitizeServiceName(name);
    static std::mutex registry_mutex;
    static std::map<std::string, std::unique_ptr<ServiceLogger>> registry;

    std::lock_guard<std::mutex> lock(registry_mutex);
    if (auto it = registry.find(key); it != registry.end()) {
      return *it->second;
    }

    auto logger = std::unique_ptr<ServiceLogger>(new ServiceLogger(std::move(name)));
    auto *raw = logger.get();
    registry.emplace(key, std::move(logger));
    return *raw;
  }

  ServiceLogger(const ServiceLogger &) = delete;
  ServiceLogger &operator=(const ServiceLogger &) = delete;

  bool Enabled(Level level) const { return level >= detail::MinimumLevel(); }

  void Log(std::string_view category, std::string_view message, std::string_view context = {}) {
    const auto level = detail::LevelForCategory(category);
    if (!Enabled(level)) {
      return;
    }
    const auto timestamp = detail::TimestampNow();
    const auto entry = detail::BuildLogEntry(timestamp, service_name_, category, message, context);
    {
      std::lock_guard<std::mutex> lock(detail::LogMutex());
      detail::AppendLogEntry(log_file_, entry);
      if (level == Level::kError) {
        detail::AppendLogEntry(detail::ErrorLogFilePath(), entry);
      }
      if (detail::ConsoleEnabled()) {
        detail::EmitConsole(service_name_, category, message, context);
      }
    }
  }

  void Debug(std::string_view message, std::string_view context = {}) {
    Log(detail::LevelName(Level::kDebug), message, context);
  }

  void Info(std::string_view message, std::string_view context = {}) {
    Log(detail::LevelName(Level::kInfo), message, context);
  }

  void Warn(std::string_view message, std::string_view context = {}) {
    Log(detail::LevelName(Level::kWarn), message, context);
  }

  void Error(std::string_view message, std::string_view context = {}) {
    Log(detail::LevelName(Level::kError), message, context);
  }

 private:
  explicit ServiceLogger(std::string service_name)
      : service_name_(std::move(service_name)),
        service_key_(detail::SanitizeServiceName(service_name_)),
        log_file_(detail::LogFilePath(service_key_)) {}

  std::string service_name_;
  std::string service_key_;
  std::filesystem::path log_file_;
};

}  // namespace logging

#endif  // CANDIDATE_REGISTRY_LOGGER_H
