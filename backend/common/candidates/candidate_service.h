#ifndef CANDIDATE_REGISTRY_CANDIDATES_CANDIDATE_SERVICE_H
#define CANDIDATE_REGISTRY_CANDIDATES_CANDIDATE_SERVICE_H

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "candidate_record.h"
#include "candidate_store.h"
#include "filename_resolver.h"
#include "resume_storage.h"

namespace candidates {

struct ResumeUpload {
  std::string filename;
  std::string content;
  std::string content_type;
};

std::string Sha256Hex(const std::string &data);

class CandidateService {
 public:
  using ClockFn = std::function<Clock::time_point()>;

  CandidateService(CandidateStore &store, ResumeStorage &storage, FilenameResolver resolver,
                   ClockFn clock = &Clock::now);

  // Checks the resume type, validates the fields, then allocates an id, writes
  // the resume and stores the record as one unit. Throws CandidateRejected for
  // client errors; any other exception leaves neither record nor file behind.
  CandidateRecord Create(const CandidateFields &fields, const std::optional<ResumeUpload> &resume);

  std::optional<CandidateRecord> Get(long long id) const;
  std::vector<CandidateRecord> List(const CandidateFilter &filter) const;

  // Returns false when no record has this id. A resume that cannot be
  // removed is logged and does not fail the delete.
  bool Delete(long long id);

 private:
  CandidateRecord Persist(const CandidateProfile &profile, const ResumeUpload &resume);

  CandidateStore &store_;
  ResumeStorage &storage_;
  FilenameResolver resolver_;
  ClockFn clock_;
  std::mutex create_mutex_;
};

}  // namespace candidates

#endif  // CANDIDATE_REGISTRY_CANDIDATES_CANDIDATE_SERVICE_H
