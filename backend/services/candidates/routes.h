#ifndef CANDIDATE_REGISTRY_SERVICES_CANDIDATES_ROUTES_H
#define CANDIDATE_REGISTRY_SERVICES_CANDIDATES_ROUTES_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <httplib.h>

#include "../../common/candidates/candidate_record.h"
#include "../../common/candidates/candidate_service.h"
#include "../../common/candidates/rejection.h"

namespace candidates::routes {

// Multipart parts win over url-encoded parameters of the same name.
CandidateFields FieldsFromRequest(const httplib::Request &req);
std::optional<ResumeUpload> ResumeFromRequest(const httplib::Request &req);

// Reads skill/minExperience/graduationYear. Invalid values are reported in
// `rejections` and leave the corresponding filter unset.
CandidateFilter FilterFromRequest(const httplib::Request &req, std::vector<Rejection> *rejections);

std::optional<long long> ParseCandidateId(const std::string &raw);

int StatusForRejection(ErrorKind kind);

void RegisterRoutes(httplib::Server &server, CandidateService &service, std::string_view service_name);

}  // namespace candidates::routes

#endif  // CANDIDATE_REGISTRY_SERVICES_CANDIDATES_ROUTES_H
