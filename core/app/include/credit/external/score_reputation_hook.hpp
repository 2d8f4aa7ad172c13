#pragma once

#include "credit/config/ledger_config.hpp"
#include "credit/external/i_reputation_hook.hpp"
#include "credit/external/i_reputation_store.hpp"

#include <memory>
#include <stdexcept>
#include <unordered_set>

namespace credit {

// Thrown by ScoreReputationHook in strict mode.
class HookRejected : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// ScoreReputationHook
// -----------------------------------------------------------------------------
//
// @brief  IReputationHook that writes to an IReputationStore.
//
// @details
//   onLoanOpened     remembers the loan id.
//   onLoanAdopted    same, for loans already open when the hook is installed.
//   onLoanRepaid     on full repayment, raises the borrower's score by
//                    score_step (clamped to max_score). Partial payments
//                    change nothing.
//   onLoanDefaulted  mints the borrower's default badge. The score is left
//                    as it is; the badge alone blocks future borrowing.
//
// In strict mode, a repaid/defaulted notification for a loan id that was
// neither opened nor adopted through this hook throws HookRejected.
// -----------------------------------------------------------------------------
class ScoreReputationHook : public IReputationHook {
 public:
  ScoreReputationHook(std::shared_ptr<IReputationStore> store,
                      const config::ReputationConfig& cfg);

  void onLoanOpened(domain::LoanId loan_id,
                    const domain::Address& borrower) override;

  void onLoanRepaid(domain::LoanId loan_id, const domain::Address& borrower,
                    domain::Amount paid, domain::Amount total_repaid,
                    domain::Amount total_debt, bool fully_repaid) override;

  void onLoanDefaulted(domain::LoanId loan_id,
                       const domain::Address& borrower) override;

  void onLoanAdopted(domain::LoanId loan_id,
                     const domain::Address& borrower) override;

 private:
  void requireKnown(domain::LoanId loan_id) const;

  std::shared_ptr<IReputationStore> store_;
  const config::ReputationConfig cfg_;
  std::unordered_set<domain::LoanId> open_loans_;
};

}  // namespace credit
