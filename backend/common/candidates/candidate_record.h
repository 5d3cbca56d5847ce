#ifndef CANDIDATE_REGISTRY_CANDIDATES_CANDIDATE_RECORD_H
#define CANDIDATE_REGISTRY_CANDIDATES_CANDIDATE_RECORD_H

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace candidates {

using Clock = std::chrono::system_clock;

struct CalendarDate {
  int year = 1970;
  int month = 1;
  int day = 1;
};

bool operator==(const CalendarDate &lhs, const CalendarDate &rhs);
bool operator!=(const CalendarDate &lhs, const CalendarDate &rhs);
bool operator<(const CalendarDate &lhs, const CalendarDate &rhs);

// Accepts exactly YYYY-MM-DD naming a real day of the Gregorian calendar.
std::optional<CalendarDate> ParseIsoDate(std::string_view text);
std::string FormatIsoDate(const CalendarDate &date);
CalendarDate UtcDate(Clock::time_point point);

// Raw form values as submitted; a field is nullopt when the part was absent.
struct CandidateFields {
  std::optional<std::string> full_name;
  std::optional<std::string> date_of_birth;
  std::optional<std::string> contact_number;
  std::optional<std::string> address;
  std::optional<std::string> qualification;
  std::optional<std::string> graduation_year;
  std::optional<std::string> years_of_experience;
  std::optional<std::string> skills;
};

// Normalized profile that satisfied every field rule.
struct CandidateProfile {
  std::string full_name;
  CalendarDate date_of_birth;
  std::string contact_number;
  std::string address;
  std::string qualification;
  int graduation_year = 0;
  double years_of_experience = 0.0;
  std::vector<std::string> skills;
};

bool operator==(const CandidateProfile &lhs, const CandidateProfile &rhs);

struct CandidateRecord {
  long long id = 0;
  CandidateProfile profile;
  std::string resume_filename;
  std::string resume_path;
  std::string resume_checksum;
  std::size_t resume_size = 0;
  Clock::time_point created_at;
};

struct CandidateFilter {
  std::optional<std::string> skill;
  std::optional<double> min_experience;
  std::optional<int> graduation_year;
};

bool MatchesFilter(const CandidateRecord &record, const CandidateFilter &filter);

}  // namespace candidates

#endif  // CANDIDATE_REGISTRY_CANDIDATES_CANDIDATE_RECORD_H
