#include "filename_resolver.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "normalizer.h"

namespace candidates {
namespace {

constexpr char kFallbackName[] = "resume";

bool IsSafeChar(char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '.' ||
         ch == '_' || ch == '-';
}

}  // namespace

std::string SafeFilename(std::string_view original) {
  std::string safe;
  safe.reserve(original.size());
  bool in_replaced_run = false;
  for (const char ch : original) {
    if (IsSafeChar(ch)) {
      safe.push_back(ch);
      in_replaced_run = false;
    } else if (!in_replaced_run) {
      safe.push_back('_');
      in_replaced_run = true;
    }
  }
  const auto first = safe.find_first_not_of('_');
  if (first == std::string::npos) {
    return kFallbackName;
  }
  const auto last = safe.find_last_not_of('_');
  safe = safe.substr(first, last - first + 1);
  if (safe.find_first_not_of('.') == std::string::npos) {
    return kFallbackName;
  }
  return safe;
}

std::pair<std::string, std::string> SplitExtension(std::string_view name) {
  const auto separator = name.rfind('/');
  const auto dot = name.rfind('.');
  if (dot != std::string_view::npos && (separator == std::string_view::npos || dot > separator)) {
    std::size_t index = separator == std::string_view::npos ? 0 : separator + 1;
    for (; index < dot; ++index) {
      if (name[index] != '.') {
        return {std::string(name.substr(0, dot)), std::string(name.substr(dot))};
      }
    }
  }
  return {std::string(name), std::string()};
}

std::string DetectExtension(std::string_view filename) {
  return normalize::ToLower(SplitExtension(filename).second);
}

const std::vector<std::string> &AllowedResumeExtensions() {
  static const std::vector<std::string> kAllowed = {".pdf", ".doc", ".docx"};
  return kAllowed;
}

std::optional<Rejection> CheckResumeType(std::string_view filename) {
  const auto extension = DetectExtension(filename);
  const auto &allowed = AllowedResumeExtensions();
  if (std::find(allowed.begin(), allowed.end(), extension) != allowed.end()) {
    return std::nullopt;
  }
  return Rejection{ErrorKind::kUnsupportedFileType, "Resume",
                   "Only PDF/DOC/DOCX allowed. Got: " + (extension.empty() ? std::string("unknown") : extension)};
}

FilenameResolver::FilenameResolver(std::filesystem::path upload_directory)
    : upload_directory_(std::move(upload_directory)) {}

std::string FilenameResolver::PathFor(const std::string &name) const {
  return (upload_directory_ / name).string();
}

std::string FilenameResolver::ResolveStoragePath(long long id, std::string_view original_filename,
                                                 const ExistsFn &exists) const {
  const std::string safe_name = SafeFilename(original_filename);
  const std::string preferred = PathFor(safe_name);
  if (!exists(preferred)) {
    return preferred;
  }
  const auto [base, extension] = SplitExtension(safe_name);
  std::ostringstream marker;
  marker << base << "_(" << id << ')';
  const std::string stem = marker.str();
  std::string candidate = PathFor(stem + extension);
  for (int attempt = 2; exists(candidate); ++attempt) {
    if (attempt > kMaxCollisionAttempts) {
      throw std::runtime_error("storage_path_exhausted");
    }
    candidate = PathFor(stem + "_" + std::to_string(attempt) + extension);
  }
  return candidate;
}

}  // namespace candidates
