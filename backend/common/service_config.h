#ifndef CANDIDATE_REGISTRY_SERVICE_CONFIG_H
#define CANDIDATE_REGISTRY_SERVICE_CONFIG_H

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>

namespace config {

inline constexpr int kDefaultPort = 8000;
inline constexpr std::size_t kDefaultMaxResumeBytes = 10 * 1024 * 1024;
inline constexpr const char *kEnvFileVariable = "CANDIDATE_REGISTRY_ENV_FILE";

struct ServiceConfig {
  std::string host = "0.0.0.0";
  int port = kDefaultPort;
  std::filesystem::path upload_directory = "uploads";
  std::size_t max_resume_bytes = kDefaultMaxResumeBytes;
};

// Looks a variable up by name; returns nullptr when unset.
using EnvLookup = std::function<const char *(const char *)>;

// KEY=value pairs from a dotenv file. Blank lines, `#` comments and lines
// without `=` are skipped; an `export ` prefix and matching quotes are
// stripped. A missing file yields an empty map.
std::map<std::string, std::string> ReadEnvFile(const std::filesystem::path &path);

ServiceConfig LoadServiceConfig(const EnvLookup &lookup);

// Applies the env file named by CANDIDATE_REGISTRY_ENV_FILE, or else the
// nearest `.env` above the working directory followed by its `.env.local`,
// then reads the config from the process environment.
ServiceConfig LoadServiceConfigFromEnv();

}  // namespace config

#endif  // CANDIDATE_REGISTRY_SERVICE_CONFIG_H
