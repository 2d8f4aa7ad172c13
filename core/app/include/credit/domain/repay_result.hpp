#pragma once

#include "credit/domain/types.hpp"

namespace credit {
namespace domain {

// Returned by LoanLedger::repay().
struct RepayResult {
  Amount paid_net{0};      // part of this payment credited to the debt
  Amount total_repaid{0};  // loan.principal_repaid after this payment
  Amount total_debt{0};    // principal + interest at the time of payment
  bool fully_repaid{false};
};

}  // namespace domain
}  // namespace credit
