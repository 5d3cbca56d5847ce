#ifndef CANDIDATE_REGISTRY_CANDIDATES_CANDIDATE_JSON_H
#define CANDIDATE_REGISTRY_CANDIDATES_CANDIDATE_JSON_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "candidate_record.h"
#include "rejection.h"

namespace candidates {

nlohmann::json CandidateToJson(const CandidateRecord &record);
nlohmann::json CandidatesToJson(const std::vector<CandidateRecord> &records);

nlohmann::json RejectionToJson(const Rejection &rejection);

// {"error": <code of the first rejection>, "detail": <combined message>, "rejections": [...]}
nlohmann::json RejectionBody(const CandidateRejected &rejected);

std::string FormatTimestamp(Clock::time_point point);

}  // namespace candidates

#endif  // CANDIDATE_REGISTRY_CANDIDATES_CANDIDATE_JSON_H
