#pragma once

#include "credit/domain/loan_status.hpp"
#include "credit/domain/types.hpp"

namespace credit {
namespace domain {

// -----------------------------------------------------------------------------
// Loan: one borrowing position
// -----------------------------------------------------------------------------
//
// @brief  Plain record owned exclusively by LoanLedger.
//
// @details
// principal is the gross amount requested, which is also what the borrower
// owes before interest. It is not the amount disbursed: the origination fee
// is taken out of the disbursement, so the borrower receives
// principal - fee.
//
// principal_repaid never decreases while the loan is Active. On full
// repayment it is clamped to the total debt at that instant, so for a
// Repaid loan it records exactly what the position cost the borrower.
//
// collateral_amount stays in ledger custody while Active and is counted in
// LoanLedger::lockedCollateral(). It is returned on repayment and kept
// (minus the keeper bounty) on default.
// -----------------------------------------------------------------------------
struct Loan {
  LoanId id{kNoLoan};
  Address borrower;
  AssetId asset;
  AssetId collateral_asset;
  Amount principal{0};  // gross, before the origination fee is deducted
  Amount principal_repaid{0};
  Amount collateral_amount{0};
  Timestamp start_ts{0};
  Timestamp due_ts{0};
  LoanStatus status{LoanStatus::None};
};

}  // namespace domain
}  // namespace credit
