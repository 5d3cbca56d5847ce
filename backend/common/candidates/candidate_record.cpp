#include "candidate_record.h"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <tuple>

#include "../text_utils.h"
#include "normalizer.h"

namespace candidates {
namespace {

bool IsLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeapYear(year)) {
    return 29;
  }
  return kDays[month - 1];
}

bool ReadDigits(std::string_view text, std::size_t offset, std::size_t count, int *out) {
  int value = 0;
  for (std::size_t i = offset; i < offset + count; ++i) {
    const char ch = text[i];
    if (ch < '0' || ch > '9') {
      return false;
    }
    value = value * 10 + (ch - '0');
  }
  *out = value;
  return true;
}

}  // namespace

bool operator==(const CalendarDate &lhs, const CalendarDate &rhs) {
  return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}

bool operator!=(const CalendarDate &lhs, const CalendarDate &rhs) {
  return !(lhs == rhs);
}

bool operator<(const CalendarDate &lhs, const CalendarDate &rhs) {
  return std::tie(lhs.year, lhs.month, lhs.day) < std::tie(rhs.year, rhs.month, rhs.day);
}

std::optional<CalendarDate> ParseIsoDate(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  CalendarDate date;
  if (!ReadDigits(text, 0, 4, &date.year) || !ReadDigits(text, 5, 2, &date.month) ||
      !ReadDigits(text, 8, 2, &date.day)) {
    return std::nullopt;
  }
  if (date.year < 1 || date.month < 1 || date.month > 12) {
    return std::nullopt;
  }
  if (date.day < 1 || date.day > DaysInMonth(date.year, date.month)) {
    return std::nullopt;
  }
  return date;
}

std::string FormatIsoDate(const CalendarDate &date) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month, date.day);
  return buffer;
}

CalendarDate UtcDate(Clock::time_point point) {
  const std::time_t seconds = Clock::to_time_t(point);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &seconds);
#else
  gmtime_r(&seconds, &tm);
#endif
  return CalendarDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

bool operator==(const CandidateProfile &lhs, const CandidateProfile &rhs) {
  return lhs.full_name == rhs.full_name && lhs.date_of_birth == rhs.date_of_birth &&
         lhs.contact_number == rhs.contact_number && lhs.address == rhs.address &&
         lhs.qualification == rhs.qualification && lhs.graduation_year == rhs.graduation_year &&
         lhs.years_of_experience == rhs.years_of_experience && lhs.skills == rhs.skills;
}

bool MatchesFilter(const CandidateRecord &record, const CandidateFilter &filter) {
  if (filter.skill) {
    const std::string wanted = normalize::ToLower(text::Trim(*filter.skill));
    if (!wanted.empty()) {
      const auto &skills = record.profile.skills;
      const bool found = std::any_of(skills.begin(), skills.end(), [&wanted](const std::string &skill) {
        return normalize::ToLower(skill) == wanted;
      });
      if (!found) {
        return false;
      }
    }
  }
  if (filter.min_experience && record.profile.years_of_experience < *filter.min_experience) {
    return false;
  }
  if (filter.graduation_year && record.profile.graduation_year != *filter.graduation_year) {
    return false;
  }
  return true;
}

}  // namespace candidates
