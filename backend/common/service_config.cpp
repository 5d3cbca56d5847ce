#include "service_config.h"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <system_error>

#include "text_utils.h"

namespace config {
namespace {

constexpr int kEnvSearchDepth = 8;

std::string ValueOr(const EnvLookup &lookup, const char *key, const std::string &fallback) {
  if (const char *value = lookup(key); value != nullptr && *value != '\0') {
    return value;
  }
  return fallback;
}

int ResolvePort(const EnvLookup &lookup) {
  const auto parsed = text::ParseInteger(ValueOr(lookup, "CANDIDATES_PORT", ""));
  if (!parsed || *parsed <= 0 || *parsed > 65535) {
    return kDefaultPort;
  }
  return static_cast<int>(*parsed);
}

std::size_t ResolveMaxResumeBytes(const EnvLookup &lookup) {
  const auto parsed = text::ParseInteger(ValueOr(lookup, "MAX_RESUME_BYTES", ""));
  if (!parsed || *parsed <= 0) {
    return kDefaultMaxResumeBytes;
  }
  return static_cast<std::size_t>(*parsed);
}

std::string Unquote(std::string value) {
  if (value.size() >= 2) {
    const char first = value.front();
    if ((first == '"' || first == '\'') && value.back() == first) {
      return value.substr(1, value.size() - 2);
    }
  }
  return value;
}

void ApplyEnvFile(const std::filesystem::path &path, bool override_existing) {
  for (const auto &[key, value] : ReadEnvFile(path)) {
    if (!override_existing && std::getenv(key.c_str()) != nullptr) {
      continue;
    }
#ifdef _WIN32
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 1);
#endif
  }
}

std::optional<std::filesystem::path> FindEnvFile(std::filesystem::path dir) {
  std::error_code ec;
  for (int depth = 0; depth < kEnvSearchDepth; ++depth) {
    const auto candidate = dir / ".env";
    if (std::filesystem::is_regular_file(candidate, ec)) {
      return candidate;
    }
    const auto parent = dir.parent_path();
    if (parent.empty() || parent == dir) {
      break;
    }
    dir = parent;
  }
  return std::nullopt;
}

void ApplyEnvironmentFiles() {
  const auto cwd = std::filesystem::current_path();
  if (const char *explicit_file = std::getenv(kEnvFileVariable); explicit_file && *explicit_file) {
    std::filesystem::path path(explicit_file);
    if (path.is_relative()) {
      path = cwd / path;
    }
    ApplyEnvFile(path, true);
    return;
  }
  const auto base = FindEnvFile(cwd);
  if (!base) {
    return;
  }
  ApplyEnvFile(*base, false);
  auto local = *base;
  local += ".local";
  ApplyEnvFile(local, true);
}

}  // namespace

std::map<std::string, std::string> ReadEnvFile(const std::filesystem::path &path) {
  std::map<std::string, std::string> values;
  std::ifstream stream(path);
  std::string line;
  while (std::getline(stream, line)) {
    const auto trimmed = text::Trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    const auto equals = trimmed.find('=');
    if (equals == std::string::npos) {
      continue;
    }
    auto key = text::Trim(trimmed.substr(0, equals));
    if (key.rfind("export ", 0) == 0) {
      key = text::Trim(key.substr(7));
    }
    if (!key.empty()) {
      values[key] = Unquote(text::Trim(trimmed.substr(equals + 1)));
    }
  }
  return values;
}

ServiceConfig LoadServiceConfig(const EnvLookup &lookup) {
  ServiceConfig result;
  result.host = ValueOr(lookup, "CANDIDATES_HOST", result.host);
  result.port = ResolvePort(lookup);
  result.upload_directory = ValueOr(lookup, "UPLOAD_DIRECTORY", result.upload_directory.string());
  result.max_resume_bytes = ResolveMaxResumeBytes(lookup);
  return result;
}

ServiceConfig LoadServiceConfigFromEnv() {
  ApplyEnvironmentFiles();
  return LoadServiceConfig([](const char *key) { return std::getenv(key); });
}

}  // namespace config
