#include "resume_storage.h"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace candidates {

LocalResumeStorage::LocalResumeStorage(std::filesystem::path root) : root_(std::move(root)) {}

void LocalResumeStorage::EnsureRoot() const {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw std::filesystem::filesystem_error("upload_directory_unavailable", root_, ec);
  }
}

bool LocalResumeStorage::Exists(const std::string &path) const {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

void LocalResumeStorage::Write(const std::string &path, const std::string &content) {
  const std::filesystem::path target(path);
  std::filesystem::path staging = target;
  staging += ".partial";
  {
    std::ofstream stream(staging, std::ios::binary | std::ios::trunc);
    if (!stream.is_open()) {
      throw std::runtime_error("resume_open_failed: " + staging.string());
    }
    stream.write(content.data(), static_cast<std::streamsize>(content.size()));
    stream.flush();
    if (!stream) {
      stream.close();
      std::error_code ignored;
      std::filesystem::remove(staging, ignored);
      throw std::runtime_error("resume_write_failed: " + staging.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(staging, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(staging, ignored);
    throw std::filesystem::filesystem_error("resume_rename_failed", staging, target, ec);
  }
}

bool LocalResumeStorage::Remove(const std::string &path) {
  std::error_code ec;
  const bool removed = std::filesystem::remove(path, ec);
  if (ec) {
    throw std::filesystem::filesystem_error("resume_remove_failed", path, ec);
  }
  return removed;
}

}  // namespace candidates
