#ifndef CANDIDATE_REGISTRY_CANDIDATES_CANDIDATE_STORE_H
#define CANDIDATE_REGISTRY_CANDIDATES_CANDIDATE_STORE_H

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "candidate_record.h"

namespace candidates {

// In-memory record set. Ids start at 1, only grow, and are never handed out twice.
class CandidateStore {
 public:
  CandidateStore() = default;
  CandidateStore(const CandidateStore &) = delete;
  CandidateStore &operator=(const CandidateStore &) = delete;

  long long AllocateId();

  // Throws std::invalid_argument when the id was never allocated or is already stored.
  void Put(CandidateRecord record);

  std::optional<CandidateRecord> Get(long long id) const;
  std::optional<CandidateRecord> Delete(long long id);

  // Newest first by creation time, ties by descending id.
  std::vector<CandidateRecord> List() const;

  std::size_t Size() const;

 private:
  mutable std::mutex mutex_;
  long long next_id_ = 1;
  std::map<long long, CandidateRecord> records_;
};

}  // namespace candidates

#endif  // CANDIDATE_REGISTRY_CANDIDATES_CANDIDATE_STORE_H
