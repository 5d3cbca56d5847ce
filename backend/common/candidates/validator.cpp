#include "validator.h"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../text_utils.h"
#include "normalizer.h"

namespace candidates {
namespace {

class RejectionCollector {
 public:
  void Add(ErrorKind kind, std::string field, std::string message) {
    rejections_.push_back(Rejection{kind, std::move(field), std::move(message)});
  }

  void Missing(const std::string &field) { Add(ErrorKind::kMissingField, field, "field required"); }

  bool empty() const { return rejections_.empty(); }
  std::vector<Rejection> Take() { return std::move(rejections_); }

 private:
  std::vector<Rejection> rejections_;
};

std::string LengthMessage(std::size_t min, std::size_t max) {
  std::ostringstream oss;
  oss << "length must be between " << min << " and " << max << " characters";
  return oss.str();
}

std::string CheckText(const std::optional<std::string> &value, const std::string &field, std::size_t min,
                      std::size_t max, RejectionCollector &collector) {
  if (!value) {
    collector.Missing(field);
    return {};
  }
  const auto length = normalize::CountCodePoints(*value);
  if (length < min || length > max) {
    collector.Add(ErrorKind::kOutOfRange, field, LengthMessage(min, max));
  }
  return *value;
}

CalendarDate CheckDateOfBirth(const std::optional<std::string> &value, const CalendarDate &today,
                              RejectionCollector &collector) {
  if (!value) {
    collector.Missing("DOB");
    return {};
  }
  const auto parsed = ParseIsoDate(*value);
  if (!parsed) {
    collector.Add(ErrorKind::kInvalidDateFormat, "DOB", "DOB must be in YYYY-MM-DD format");
    return {};
  }
  if (today < *parsed) {
    collector.Add(ErrorKind::kFutureDate, "DOB", "DOB cannot be in the future.");
  }
  return *parsed;
}

std::string CheckPhone(const std::optional<std::string> &value, RejectionCollector &collector) {
  if (!value) {
    collector.Missing("ContactNumber");
    return {};
  }
  std::string digits = normalize::NormalizePhone(*value);
  if (digits.size() < FieldLimits::kPhoneDigitsMin || digits.size() > FieldLimits::kPhoneDigitsMax) {
    collector.Add(ErrorKind::kInvalidPhone, "ContactNumber", "Contact number must contain 10 to 15 digits.");
  }
  return digits;
}

int CheckGraduationYear(const std::optional<std::string> &value, RejectionCollector &collector) {
  if (!value) {
    collector.Missing("GraduationYear");
    return 0;
  }
  const auto parsed = text::ParseInteger(*value);
  if (!parsed) {
    collector.Add(ErrorKind::kInvalidNumber, "GraduationYear", "must be a valid integer");
    return 0;
  }
  if (*parsed < FieldLimits::kGraduationYearMin || *parsed > FieldLimits::kGraduationYearMax) {
    collector.Add(ErrorKind::kOutOfRange, "GraduationYear", "must be between 1950 and 2100");
    return 0;
  }
  return static_cast<int>(*parsed);
}

double CheckExperience(const std::optional<std::string> &value, RejectionCollector &collector) {
  if (!value) {
    collector.Missing("YearsOfExperience");
    return 0.0;
  }
  const auto parsed = ParseDecimal(*value);
  if (!parsed) {
    collector.Add(ErrorKind::kInvalidNumber, "YearsOfExperience", "must be a valid number");
    return 0.0;
  }
  if (!std::isfinite(*parsed) || *parsed < FieldLimits::kExperienceMin ||
      *parsed > FieldLimits::kExperienceMax) {
    collector.Add(ErrorKind::kOutOfRange, "YearsOfExperience", "must be between 0 and 60");
    return 0.0;
  }
  return *parsed;
}

std::vector<std::string> CheckSkills(const std::optional<std::string> &value, RejectionCollector &collector) {
  if (!value) {
    collector.Missing("Skills");
    return {};
  }
  auto skills = normalize::ParseSkills(*value);
  if (skills.empty()) {
    collector.Add(ErrorKind::kEmptySkills, "Skills", "Skills must contain at least one skill.");
  }
  return skills;
}

}  // namespace

std::optional<double> ParseDecimal(std::string_view value) {
  const std::string trimmed = text::Trim(value);
  if (trimmed.empty() || trimmed.find_first_of("xX") != std::string::npos) {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(trimmed, &consumed);
    if (consumed != trimmed.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::logic_error &) {
    return std::nullopt;
  }
}

ValidationResult Validate(const CandidateFields &fields, const CalendarDate &today) {
  RejectionCollector collector;
  CandidateProfile profile;
  profile.full_name =
      CheckText(fields.full_name, "FullName", FieldLimits::kFullNameMin, FieldLimits::kFullNameMax, collector);
  profile.date_of_birth = CheckDateOfBirth(fields.date_of_birth, today, collector);
  profile.contact_number = CheckPhone(fields.contact_number, collector);
  profile.address =
      CheckText(fields.address, "Address", FieldLimits::kAddressMin, FieldLimits::kAddressMax, collector);
  profile.qualification = CheckText(fields.qualification, "Qualification", FieldLimits::kQualificationMin,
                                    FieldLimits::kQualificationMax, collector);
  profile.graduation_year = CheckGraduationYear(fields.graduation_year, collector);
  profile.years_of_experience = CheckExperience(fields.years_of_experience, collector);
  profile.skills = CheckSkills(fields.skills, collector);

  ValidationResult result;
  if (collector.empty()) {
    result.profile = std::move(profile);
  } else {
    result.rejections = collector.Take();
  }
  return result;
}

}  // namespace candidates
