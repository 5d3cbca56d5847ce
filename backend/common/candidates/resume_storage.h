#ifndef CANDIDATE_REGISTRY_CANDIDATES_RESUME_STORAGE_H
#define CANDIDATE_REGISTRY_CANDIDATES_RESUME_STORAGE_H

#include <filesystem>
#include <string>

namespace candidates {

class ResumeStorage {
 public:
  virtual ~ResumeStorage() = default;

  virtual bool Exists(const std::string &path) const = 0;

  // Either the whole content ends up at `path` or nothing does; throws on failure.
  virtual void Write(const std::string &path, const std::string &content) = 0;

  // Returns false when there was nothing to remove; throws when removal failed.
  virtual bool Remove(const std::string &path) = 0;
};

class LocalResumeStorage : public ResumeStorage {
 public:
  explicit LocalResumeStorage(std::filesystem::path root);

  // Creates the upload directory if needed.
  void EnsureRoot() const;

  bool Exists(const std::string &path) const override;
  void Write(const std::string &path, const std::string &content) override;
  bool Remove(const std::string &path) override;

 private:
  std::filesystem::path root_;
};

}  // namespace candidates

#endif  // CANDIDATE_REGISTRY_CANDIDATES_RESUME_STORAGE_H
