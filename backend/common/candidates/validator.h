#ifndef CANDIDATE_REGISTRY_CANDIDATES_VALIDATOR_H
#define CANDIDATE_REGISTRY_CANDIDATES_VALIDATOR_H

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "candidate_record.h"
#include "rejection.h"

namespace candidates {

struct FieldLimits {
  static constexpr std::size_t kFullNameMin = 2;
  static constexpr std::size_t kFullNameMax = 100;
  static constexpr std::size_t kAddressMin = 5;
  static constexpr std::size_t kAddressMax = 300;
  static constexpr std::size_t kQualificationMin = 2;
  static constexpr std::size_t kQualificationMax = 120;
  static constexpr std::size_t kPhoneDigitsMin = 10;
  static constexpr std::size_t kPhoneDigitsMax = 15;
  static constexpr int kGraduationYearMin = 1950;
  static constexpr int kGraduationYearMax = 2100;
  static constexpr double kExperienceMin = 0.0;
  static constexpr double kExperienceMax = 60.0;
};

struct ValidationResult {
  std::optional<CandidateProfile> profile;
  std::vector<Rejection> rejections;

  bool ok() const { return profile.has_value(); }
};

// Normalizes and checks every field, collecting all rejections instead of
// stopping at the first. Pure: touches neither the filesystem nor the store.
ValidationResult Validate(const CandidateFields &fields, const CalendarDate &today);

// Decimal number with optional exponent; hexadecimal forms are refused.
// "inf" and "nan" parse and are left to the range checks.
std::optional<double> ParseDecimal(std::string_view value);

}  // namespace candidates

#endif  // CANDIDATE_REGISTRY_CANDIDATES_VALIDATOR_H
