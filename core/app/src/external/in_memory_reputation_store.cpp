#include "credit/external/in_memory_reputation_store.hpp"

#include <algorithm>

namespace credit {

domain::Score InMemoryReputationStore::scoreOf(
    const domain::Address& addr) const {
  auto it = scores_.find(addr);
  return (it == scores_.end()) ? 0 : it->second;
}

void InMemoryReputationStore::setScore(const domain::Address& addr,
                                       domain::Score score) {
  scores_[addr] = std::min(score, max_score_);
}

bool InMemoryReputationStore::hasBadge(const domain::Address& addr) const {
  return badges_.count(addr) > 0;
}

void InMemoryReputationStore::mintBadge(const domain::Address& addr) {
  badges_.insert(addr);
}

}  // namespace credit
