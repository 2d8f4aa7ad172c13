#pragma once

#include "credit/domain/types.hpp"

namespace credit {

// -----------------------------------------------------------------------------
// Ledger notifications
// -----------------------------------------------------------------------------
//
// Published on LoanLedger's EventBus after an operation has committed. An
// operation that throws publishes nothing. Plain value types: safe to copy
// into the IPC telemetry queue.
// -----------------------------------------------------------------------------

struct LoanOpenedEvent {
  domain::LoanId loan_id{domain::kNoLoan};
  domain::Address borrower;
  domain::AssetId asset;
  domain::Amount principal{0};
  domain::Amount origination_fee{0};
  domain::AssetId collateral_asset;
  domain::Amount collateral_amount{0};
  domain::Timestamp start_ts{0};
  domain::Timestamp due_ts{0};
};

struct LoanRepaidEvent {
  domain::LoanId loan_id{domain::kNoLoan};
  domain::Address borrower;
  domain::Amount paid_net{0};
  domain::Amount refund{0};  // overpayment returned to the payer
  domain::Amount total_repaid{0};
  domain::Amount total_debt{0};
  domain::Amount protocol_fee{0};
  bool fully_repaid{false};
  domain::Timestamp timestamp{0};
};

struct LoanDefaultedEvent {
  domain::LoanId loan_id{domain::kNoLoan};
  domain::Address borrower;
  domain::Address keeper;
  domain::Amount bounty{0};
  domain::Amount collateral_retained{0};
  domain::Amount debt_at_default{0};
  domain::Timestamp timestamp{0};
};

struct LedgerPausedEvent {
  bool paused{false};
  domain::Address by;
  domain::Timestamp timestamp{0};
};

}  // namespace credit
