#include "candidate_store.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace candidates {

long long CandidateStore::AllocateId() {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_id_++;
}

void CandidateStore::Put(CandidateRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (record.id <= 0 || record.id >= next_id_) {
    throw std::invalid_argument("candidate_id_not_allocated");
  }
  const auto id = record.id;
  if (!records_.emplace(id, std::move(record)).second) {
    throw std::invalid_argument("duplicate_candidate_id");
  }
}

std::optional<CandidateRecord> CandidateStore::Get(long long id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<CandidateRecord> CandidateStore::Delete(long long id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  CandidateRecord removed = std::move(it->second);
  records_.erase(it);
  return removed;
}

std::vector<CandidateRecord> CandidateStore::List() const {
  std::vector<CandidateRecord> records;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    records.reserve(records_.size());
    for (const auto &entry : records_) {
      records.push_back(entry.second);
    }
  }
  std::sort(records.begin(), records.end(), [](const CandidateRecord &lhs, const CandidateRecord &rhs) {
    if (lhs.created_at != rhs.created_at) {
      return lhs.created_at > rhs.created_at;
    }
    return lhs.id > rhs.id;
  });
  return records;
}

std::size_t CandidateStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

}  // namespace candidates
