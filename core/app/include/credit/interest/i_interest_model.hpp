#pragma once

#include "credit/domain/types.hpp"

namespace credit {

// Swappable debt calculator consulted by LoanLedger. Stateless with respect
// to the ledger: implementations may hold only their own configuration.
class IInterestModel {
 public:
  virtual ~IInterestModel() = default;

  // Principal plus interest at the normal rate over [start_ts, now_ts].
  virtual domain::Amount debt(domain::Amount principal,
                              domain::Timestamp start_ts,
                              domain::Timestamp now_ts) const = 0;

  // Like debt(), but time after due_ts accrues at the penalty rate.
  virtual domain::Amount debtWithPenalty(domain::Amount principal,
                                         domain::Timestamp start_ts,
                                         domain::Timestamp due_ts,
                                         domain::Timestamp now_ts) const = 0;
};

}  // namespace credit
