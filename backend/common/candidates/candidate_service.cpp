#include "candidate_service.h"

#include <array>
#include <exception>
#include <filesystem>
#include <utility>

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

#include "../logger.h"
#include "rejection.h"
#include "validator.h"

using json = nlohmann::json;

namespace candidates {
namespace {

logging::ServiceLogger &CandidatesLogger() {
  static auto &logger = logging::ServiceLogger::Instance("candidates");
  return logger;
}

std::string BaseName(const std::string &path) {
  return std::filesystem::path(path).filename().string();
}

}  // namespace

std::string Sha256Hex(const std::string &data) {
  std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
  SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest.data());
  static const char *kHex = "0123456789abcdef";
  std::string output;
  output.reserve(digest.size() * 2);
  for (const auto value : digest) {
    output.push_back(kHex[value >> 4]);
    output.push_back(kHex[value & 0x0F]);
  }
  return output;
}

CandidateService::CandidateService(CandidateStore &store, ResumeStorage &storage, FilenameResolver resolver,
                                   ClockFn clock)
    : store_(store), storage_(storage), resolver_(std::move(resolver)), clock_(std::move(clock)) {}

CandidateRecord CandidateService::Create(const CandidateFields &fields, const std::optional<ResumeUpload> &resume) {
  if (resume) {
    if (auto rejection = CheckResumeType(resume->filename)) {
      throw CandidateRejected({std::move(*rejection)});
    }
  }

  auto result = Validate(fields, UtcDate(clock_()));
  if (!resume) {
    result.profile.reset();
    result.rejections.push_back(Rejection{ErrorKind::kMissingField, "Resume", "field required"});
  }
  if (!result.ok()) {
    throw CandidateRejected(std::move(result.rejections));
  }
  return Persist(*result.profile, *resume);
}

CandidateRecord CandidateService::Persist(const CandidateProfile &profile, const ResumeUpload &resume) {
  std::lock_guard<std::mutex> lock(create_mutex_);
  const long long id = store_.AllocateId();
  const std::string path = resolver_.ResolveStoragePath(
      id, resume.filename, [this](const std::string &candidate) { return storage_.Exists(candidate); });

  storage_.Write(path, resume.content);

  CandidateRecord record;
  record.id = id;
  record.profile = profile;
  record.resume_filename = BaseName(path);
  record.resume_path = path;
  record.resume_checksum = Sha256Hex(resume.content);
  record.resume_size = resume.content.size();
  record.created_at = clock_();

  try {
    store_.Put(record);
  } catch (const std::exception &) {
    try {
      storage_.Remove(path);
    } catch (const std::exception &cleanup) {
      CandidatesLogger().Error("resume_cleanup_failed", json{{"path", path}, {"reason", cleanup.what()}}.dump());
    }
    throw;
  }
  CandidatesLogger().Info("candidate_created",
                          json{{"candidateId", id}, {"path", path}, {"bytes", record.resume_size}}.dump());
  return record;
}

std::optional<CandidateRecord> CandidateService::Get(long long id) const {
  return store_.Get(id);
}

std::vector<CandidateRecord> CandidateService::List(const CandidateFilter &filter) const {
  std::vector<CandidateRecord> matches;
  for (auto &record : store_.List()) {
    if (MatchesFilter(record, filter)) {
      matches.push_back(std::move(record));
    }
  }
  return matches;
}

bool CandidateService::Delete(long long id) {
  const auto removed = store_.Delete(id);
  if (!removed) {
    return false;
  }
  try {
    if (!removed->resume_path.empty() && !storage_.Remove(removed->resume_path)) {
      CandidatesLogger().Warn("resume_already_missing",
                              json{{"candidateId", id}, {"path", removed->resume_path}}.dump());
    }
  } catch (const std::exception &ex) {
    CandidatesLogger().Warn("resume_remove_failed",
                            json{{"candidateId", id}, {"path", removed->resume_path}, {"reason", ex.what()}}.dump());
  }
  CandidatesLogger().Info("candidate_deleted", json{{"candidateId", id}}.dump());
  return true;
}

}  // namespace candidates
