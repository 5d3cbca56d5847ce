#include <cstddef>
#include <exception>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "../../common/candidates/candidate_service.h"
#include "../../common/candidates/candidate_store.h"
#include "../../common/candidates/filename_resolver.h"
#include "../../common/candidates/resume_storage.h"
#include "../../common/http_middleware.h"
#include "../../common/logger.h"
#include "../../common/service_config.h"
#include "routes.h"

using json = nlohmann::json;

namespace {

constexpr char kServiceName[] = "candidates";
// Room for the text fields and multipart framing around the resume itself.
constexpr std::size_t kFormOverheadBytes = 64 * 1024;

}  // namespace

int main() {
  const auto settings = config::LoadServiceConfigFromEnv();
  auto &logger = logging::ServiceLogger::Instance(kServiceName);

  candidates::LocalResumeStorage storage(settings.upload_directory);
  try {
    storage.EnsureRoot();
  } catch (const std::exception &ex) {
    logger.Error("upload_directory_unavailable", ex.what());
    return 1;
  }

  candidates::CandidateStore store;
  candidates::CandidateService service(store, storage, candidates::FilenameResolver(settings.upload_directory));

  httplib::Server server;
  middleware::AttachStandardHandlers(server, kServiceName);
  middleware::ExposeMetrics(server, kServiceName);
  server.set_payload_max_length(settings.max_resume_bytes + kFormOverheadBytes);
  candidates::routes::RegisterRoutes(server, service, kServiceName);

  logger.Info("starting_candidates_service",
              json{{"host", settings.host},
                   {"port", settings.port},
                   {"uploadDirectory", settings.upload_directory.string()},
                   {"maxResumeBytes", settings.max_resume_bytes}}
                  .dump());
  if (!server.listen(settings.host.c_str(), settings.port)) {
    logger.Error("listen_failed", json{{"host", settings.host}, {"port", settings.port}}.dump());
    return 1;
  }
  return 0;
}
