#pragma once

#include "credit/domain/borrow_request.hpp"
#include "credit/domain/risk_result.hpp"
#include "credit/domain/types.hpp"

#include <cstdint>

namespace credit {

// Admission policy consulted by LoanLedger::open(). Swappable at runtime
// through LoanLedger::setRiskPolicy(). Never mutates ledger state.
class IRiskPolicy {
 public:
  virtual ~IRiskPolicy() = default;

  virtual std::uint64_t collateralRatioBps(
      const domain::Address& borrower) const = 0;

  virtual bool isDefaulter(const domain::Address& borrower) const = 0;

  virtual domain::RiskResult assessBorrow(
      const domain::Address& borrower,
      const domain::BorrowRequest& request) const = 0;
};

}  // namespace credit
