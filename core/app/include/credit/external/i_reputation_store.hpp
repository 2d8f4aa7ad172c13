#pragma once

#include "credit/domain/types.hpp"

namespace credit {

// Per-address credit score and default badge. The ledger only reads it
// (through RiskPolicy); writes happen in IReputationHook implementations.
class IReputationStore {
 public:
  virtual ~IReputationStore() = default;

  virtual domain::Score scoreOf(const domain::Address& addr) const = 0;
  virtual void setScore(const domain::Address& addr, domain::Score score) = 0;
  virtual bool hasBadge(const domain::Address& addr) const = 0;
  virtual void mintBadge(const domain::Address& addr) = 0;
};

}  // namespace credit
