#pragma once

#include "credit/domain/types.hpp"

namespace credit {

// -----------------------------------------------------------------------------
// IReputationHook: lifecycle notifications from LoanLedger
// -----------------------------------------------------------------------------
//
// @brief  The only place credit scores go up and default badges get minted.
//
// @details
// Called synchronously inside the ledger operation, after all custody
// movements and before the ledger commits its own state. An implementation
// may reject a notification by throwing; the ledger then rolls back every
// movement of the operation and rethrows.
// -----------------------------------------------------------------------------
class IReputationHook {
 public:
  virtual ~IReputationHook() = default;

  virtual void onLoanOpened(domain::LoanId loan_id,
                            const domain::Address& borrower) = 0;

  virtual void onLoanRepaid(domain::LoanId loan_id,
                            const domain::Address& borrower,
                            domain::Amount paid, domain::Amount total_repaid,
                            domain::Amount total_debt, bool fully_repaid) = 0;

  virtual void onLoanDefaulted(domain::LoanId loan_id,
                               const domain::Address& borrower) = 0;

  // Called once per Active loan when this hook is installed on a ledger that
  // already has open loans. Not a new loan: nothing is disbursed. Throwing
  // refuses the installation.
  virtual void onLoanAdopted(domain::LoanId /*loan_id*/,
                             const domain::Address& /*borrower*/) {}
};

}  // namespace credit
