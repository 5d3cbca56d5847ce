#ifndef CANDIDATE_REGISTRY_CANDIDATES_FILENAME_RESOLVER_H
#define CANDIDATE_REGISTRY_CANDIDATES_FILENAME_RESOLVER_H

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rejection.h"

namespace candidates {

using ExistsFn = std::function<bool(const std::string &path)>;

// Replaces each run of characters outside [A-Za-z0-9._-] with one underscore
// and trims underscores at both ends. Falls back to "resume" when nothing
// usable is left.
std::string SafeFilename(std::string_view original);

// Splits "name.ext" into {"name", ".ext"}. Leading dots of the last path
// component never start an extension.
std::pair<std::string, std::string> SplitExtension(std::string_view name);

// Lower-cased extension including the dot, or empty when there is none.
std::string DetectExtension(std::string_view filename);

const std::vector<std::string> &AllowedResumeExtensions();

// Returns an UnsupportedFileType rejection unless the extension is .pdf, .doc or .docx.
std::optional<Rejection> CheckResumeType(std::string_view filename);

class FilenameResolver {
 public:
  static constexpr int kMaxCollisionAttempts = 1000;

  explicit FilenameResolver(std::filesystem::path upload_directory);

  const std::filesystem::path &upload_directory() const { return upload_directory_; }

  // <dir>/<safe name> when free, otherwise <dir>/<base>_(<id>)<ext>. Should
  // that be taken as well, _2, _3, ... are appended after the id marker.
  std::string ResolveStoragePath(long long id, std::string_view original_filename,
                                 const ExistsFn &exists) const;

 private:
  std::string PathFor(const std::string &name) const;

  std::filesystem::path upload_directory_;
};

}  // namespace candidates

#endif  // CANDIDATE_REGISTRY_CANDIDATES_FILENAME_RESOLVER_H
