#ifndef CANDIDATE_REGISTRY_CANDIDATES_REJECTION_H
#define CANDIDATE_REGISTRY_CANDIDATES_REJECTION_H

#include <stdexcept>
#include <string>
#include <vector>

namespace candidates {

enum class ErrorKind {
  kUnsupportedFileType,
  kInvalidDateFormat,
  kFutureDate,
  kInvalidPhone,
  kEmptySkills,
  kOutOfRange,
  kMissingField,
  kInvalidNumber,
  kNotFound,
};

// Stable snake_case code used in responses and metrics.
std::string ErrorCode(ErrorKind kind);

struct Rejection {
  ErrorKind kind = ErrorKind::kOutOfRange;
  std::string field;
  std::string message;
};

bool operator==(const Rejection &lhs, const Rejection &rhs);

// Joins the messages of every rejection into one human readable line.
std::string DescribeRejections(const std::vector<Rejection> &rejections);

bool ContainsKind(const std::vector<Rejection> &rejections, ErrorKind kind);

class CandidateRejected : public std::runtime_error {
 public:
  explicit CandidateRejected(std::vector<Rejection> rejections);

  const std::vector<Rejection> &rejections() const { return rejections_; }

  // The kind of the first rejection; decides the response status.
  ErrorKind primary_kind() const;

 private:
  std::vector<Rejection> rejections_;
};

}  // namespace candidates

#endif  // CANDIDATE_REGISTRY_CANDIDATES_REJECTION_H
