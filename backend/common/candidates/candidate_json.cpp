#include "candidate_json.h"

#include "../logger.h"

namespace candidates {

std::string FormatTimestamp(Clock::time_point point) {
  return logging::detail::FormatTimestamp(point);
}

nlohmann::json CandidateToJson(const CandidateRecord &record) {
  const auto &profile = record.profile;
  return {{"id", record.id},
          {"fullName", profile.full_name},
          {"dateOfBirth", FormatIsoDate(profile.date_of_birth)},
          {"contactNumber", profile.contact_number},
          {"address", profile.address},
          {"qualification", profile.qualification},
          {"graduationYear", profile.graduation_year},
          {"yearsOfExperience", profile.years_of_experience},
          {"skills", profile.skills},
          {"resumeFilename", record.resume_filename},
          {"resumePath", record.resume_path},
          {"resumeChecksum", record.resume_checksum},
          {"resumeSize", record.resume_size},
          {"createdAt", FormatTimestamp(record.created_at)}};
}

nlohmann::json CandidatesToJson(const std::vector<CandidateRecord> &records) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto &record : records) {
    array.push_back(CandidateToJson(record));
  }
  return array;
}

nlohmann::json RejectionToJson(const Rejection &rejection) {
  return {{"kind", ErrorCode(rejection.kind)}, {"field", rejection.field}, {"message", rejection.message}};
}

nlohmann::json RejectionBody(const CandidateRejected &rejected) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto &rejection : rejected.rejections()) {
    items.push_back(RejectionToJson(rejection));
  }
  return {{"error", ErrorCode(rejected.primary_kind())}, {"detail", rejected.what()}, {"rejections", items}};
}

}  // namespace candidates
