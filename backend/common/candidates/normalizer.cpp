#include "normalizer.h"

#include <cstdint>
#include <unordered_set>

#include <unicode/locid.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>

#include "../text_utils.h"

namespace candidates::normalize {

std::string NormalizePhone(std::string_view raw) {
  std::string digits;
  digits.reserve(raw.size());
  for (const char ch : raw) {
    if (ch >= '0' && ch <= '9') {
      digits.push_back(ch);
    }
  }
  return digits;
}

std::vector<std::string> ParseSkills(std::string_view raw) {
  std::vector<std::string> unique;
  std::unordered_set<std::string> seen;
  std::size_t start = 0;
  while (start <= raw.size()) {
    std::size_t comma = raw.find(',', start);
    if (comma == std::string_view::npos) {
      comma = raw.size();
    }
    std::string skill = text::Trim(raw.substr(start, comma - start));
    if (!skill.empty() && seen.insert(ToLower(skill)).second) {
      unique.push_back(std::move(skill));
    }
    start = comma + 1;
  }
  return unique;
}

std::string ToLower(std::string_view utf8) {
  auto unicode =
      icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
  unicode.toLower(icu::Locale::getRoot());
  std::string lowered;
  unicode.toUTF8String(lowered);
  return lowered;
}

std::size_t CountCodePoints(std::string_view utf8) {
  std::size_t count = 0;
  for (const char ch : utf8) {
    if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

}  // namespace candidates::normalize
