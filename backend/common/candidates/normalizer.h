#ifndef CANDIDATE_REGISTRY_CANDIDATES_NORMALIZER_H
#define CANDIDATE_REGISTRY_CANDIDATES_NORMALIZER_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace candidates::normalize {

// Keeps only ASCII digits, in their original order. Length is not checked here.
std::string NormalizePhone(std::string_view raw);

// Splits on commas, trims each piece, drops empty pieces and removes
// case-insensitive duplicates. The first spelling of each skill wins.
std::vector<std::string> ParseSkills(std::string_view raw);

// Unicode lower-casing of a UTF-8 string (root locale), so "ÉLAN" and
// "élan" compare equal. Used for skill matching and file extensions.
std::string ToLower(std::string_view utf8);

// Number of code points in a UTF-8 string; stray continuation bytes are not counted.
std::size_t CountCodePoints(std::string_view utf8);

}  // namespace candidates::normalize

#endif  // CANDIDATE_REGISTRY_CANDIDATES_NORMALIZER_H
