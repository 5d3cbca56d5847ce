#include "rejection.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace candidates {

std::string ErrorCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnsupportedFileType:
      return "unsupported_file_type";
    case ErrorKind::kInvalidDateFormat:
      return "invalid_date_format";
    case ErrorKind::kFutureDate:
      return "future_date";
    case ErrorKind::kInvalidPhone:
      return "invalid_phone";
    case ErrorKind::kEmptySkills:
      return "empty_skills";
    case ErrorKind::kOutOfRange:
      return "out_of_range";
    case ErrorKind::kMissingField:
      return "missing_field";
    case ErrorKind::kInvalidNumber:
      return "invalid_number";
    case ErrorKind::kNotFound:
      return "not_found";
  }
  return "unknown";
}

bool operator==(const Rejection &lhs, const Rejection &rhs) {
  return lhs.kind == rhs.kind && lhs.field == rhs.field && lhs.message == rhs.message;
}

std::string DescribeRejections(const std::vector<Rejection> &rejections) {
  std::ostringstream oss;
  bool first = true;
  for (const auto &rejection : rejections) {
    if (!first) {
      oss << "; ";
    }
    first = false;
    if (!rejection.field.empty()) {
      oss << rejection.field << ": ";
    }
    oss << rejection.message;
  }
  return oss.str();
}

bool ContainsKind(const std::vector<Rejection> &rejections, ErrorKind kind) {
  return std::any_of(rejections.begin(), rejections.end(),
                     [kind](const Rejection &rejection) { return rejection.kind == kind; });
}

CandidateRejected::CandidateRejected(std::vector<Rejection> rejections)
    : std::runtime_error(DescribeRejections(rejections)), rejections_(std::move(rejections)) {}

ErrorKind CandidateRejected::primary_kind() const {
  if (rejections_.empty()) {
    return ErrorKind::kOutOfRange;
  }
  return rejections_.front().kind;
}

}  // namespace candidates
