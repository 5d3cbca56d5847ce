#include "routes.h"

#include <exception>
#include <string>

#include <nlohmann/json.hpp>

#include "../../common/candidates/candidate_json.h"
#include "../../common/candidates/validator.h"
#include "../../common/http_middleware.h"
#include "../../common/logger.h"
#include "../../common/text_utils.h"

using json = nlohmann::json;

namespace candidates::routes {
namespace {

constexpr const char *kResumeField = "Resume";

void SendJson(httplib::Response &res, const json &payload, int status = 200) {
  res.status = status;
  res.set_header("Content-Type", "application/json");
  res.body = payload.dump();
}

std::optional<std::string> FormValue(const httplib::Request &req, const std::string &name) {
  if (req.has_file(name)) {
    return req.get_file_value(name).content;
  }
  if (req.has_param(name)) {
    return req.get_param_value(name);
  }
  return std::nullopt;
}

void SendRejection(httplib::Response &res, const CandidateRejected &rejected, const std::string &service) {
  for (const auto &rejection : rejected.rejections()) {
    middleware::MetricsRegistry::Instance().RecordRejection(service, ErrorCode(rejection.kind));
  }
  SendJson(res, RejectionBody(rejected), StatusForRejection(rejected.primary_kind()));
}

void SendNotFound(httplib::Response &res) {
  SendJson(res, json{{"error", ErrorCode(ErrorKind::kNotFound)}, {"detail", "Candidate not found"}}, 404);
}

void SendInvalidId(httplib::Response &res, const std::string &raw) {
  SendJson(res, json{{"error", "invalid_id"}, {"detail", "Candidate id must be an integer, got: " + raw}}, 422);
}

}  // namespace

CandidateFields FieldsFromRequest(const httplib::Request &req) {
  CandidateFields fields;
  fields.full_name = FormValue(req, "FullName");
  fields.date_of_birth = FormValue(req, "DOB");
  fields.contact_number = FormValue(req, "ContactNumber");
  fields.address = FormValue(req, "Address");
  fields.qualification = FormValue(req, "Qualification");
  fields.graduation_year = FormValue(req, "GraduationYear");
  fields.years_of_experience = FormValue(req, "YearsOfExperience");
  fields.skills = FormValue(req, "Skills");
  return fields;
}

std::optional<ResumeUpload> ResumeFromRequest(const httplib::Request &req) {
  if (!req.has_file(kResumeField)) {
    return std::nullopt;
  }
  const auto part = req.get_file_value(kResumeField);
  return ResumeUpload{part.filename, part.content, part.content_type};
}

CandidateFilter FilterFromRequest(const httplib::Request &req, std::vector<Rejection> *rejections) {
  CandidateFilter filter;
  if (req.has_param("skill")) {
    filter.skill = req.get_param_value("skill");
  }
  if (req.has_param("minExperience")) {
    const auto parsed = ParseDecimal(req.get_param_value("minExperience"));
    if (!parsed) {
      rejections->push_back({ErrorKind::kInvalidNumber, "minExperience", "must be a valid number"});
    } else if (!(*parsed >= 0.0)) {
      rejections->push_back({ErrorKind::kOutOfRange, "minExperience", "must be greater than or equal to 0"});
    } else {
      filter.min_experience = *parsed;
    }
  }
  if (req.has_param("graduationYear")) {
    const auto parsed = text::ParseInteger(req.get_param_value("graduationYear"));
    if (!parsed) {
      rejections->push_back({ErrorKind::kInvalidNumber, "graduationYear", "must be a valid integer"});
    } else if (*parsed < FieldLimits::kGraduationYearMin || *parsed > FieldLimits::kGraduationYearMax) {
      rejections->push_back({ErrorKind::kOutOfRange, "graduationYear", "must be between 1950 and 2100"});
    } else {
      filter.graduation_year = static_cast<int>(*parsed);
    }
  }
  return filter;
}

std::optional<long long> ParseCandidateId(const std::string &raw) {
  if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  return text::ParseInteger(raw);
}

int StatusForRejection(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnsupportedFileType:
      return 415;
    case ErrorKind::kNotFound:
      return 404;
    default:
      return 422;
  }
}

void RegisterRoutes(httplib::Server &server, CandidateService &service, std::string_view service_name) {
  const std::string name(service_name);

  server.Get("/health", [](const httplib::Request &, httplib::Response &res) {
    SendJson(res, json{{"status", "ok"}});
  });

  server.Post("/candidates", [&service, name](const httplib::Request &req, httplib::Response &res) {
    auto &logger = logging::ServiceLogger::Instance(name);
    try {
      const auto record = service.Create(FieldsFromRequest(req), ResumeFromRequest(req));
      SendJson(res, CandidateToJson(record), 201);
    } catch (const CandidateRejected &rejected) {
      logger.Info("candidate_rejected", json{{"error", ErrorCode(rejected.primary_kind())},
                                             {"detail", rejected.what()},
                                             {"requestId", middleware::RequestId(req)}}
                                            .dump());
      SendRejection(res, rejected, name);
    } catch (const std::exception &ex) {
      logger.Error("create_candidate_failed", ex.what());
      SendJson(res, json{{"error", "create_candidate_failed"}}, 500);
    }
  });

  server.Get("/candidates", [&service, name](const httplib::Request &req, httplib::Response &res) {
    std::vector<Rejection> rejections;
    const auto filter = FilterFromRequest(req, &rejections);
    if (!rejections.empty()) {
      SendRejection(res, CandidateRejected(std::move(rejections)), name);
      return;
    }
    SendJson(res, CandidatesToJson(service.List(filter)));
  });

  server.Get(R"(/candidates/([^/]+))", [&service](const httplib::Request &req, httplib::Response &res) {
    const std::string raw = req.matches[1];
    const auto id = ParseCandidateId(raw);
    if (!id) {
      SendInvalidId(res, raw);
      return;
    }
    const auto record = service.Get(*id);
    if (!record) {
      SendNotFound(res);
      return;
    }
    SendJson(res, CandidateToJson(*record));
  });

  server.Delete(R"(/candidates/([^/]+))", [&service](const httplib::Request &req, httplib::Response &res) {
    const std::string raw = req.matches[1];
    const auto id = ParseCandidateId(raw);
    if (!id) {
      SendInvalidId(res, raw);
      return;
    }
    if (!service.Delete(*id)) {
      SendNotFound(res);
      return;
    }
    SendJson(res, json{{"detail", "deleted successfully"}});
  });
}

}  // namespace candidates::routes
