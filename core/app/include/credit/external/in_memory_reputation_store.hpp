#pragma once

#include "credit/external/i_reputation_store.hpp"

#include <set>
#include <unordered_map>

namespace credit {

// -----------------------------------------------------------------------------
// InMemoryReputationStore
// -----------------------------------------------------------------------------
//
// Scores are clamped to max_score on write. Badges are permanent: there is no
// burn operation, and minting twice is a no-op.
// -----------------------------------------------------------------------------
class InMemoryReputationStore : public IReputationStore {
 public:
  explicit InMemoryReputationStore(domain::Score max_score = 1000)
      : max_score_(max_score) {}

  domain::Score scoreOf(const domain::Address& addr) const override;
  void setScore(const domain::Address& addr, domain::Score score) override;
  bool hasBadge(const domain::Address& addr) const override;
  void mintBadge(const domain::Address& addr) override;

  domain::Score maxScore() const { return max_score_; }

 private:
  domain::Score max_score_;
  std::unordered_map<domain::Address, domain::Score> scores_;
  std::set<domain::Address> badges_;
};

}  // namespace credit
