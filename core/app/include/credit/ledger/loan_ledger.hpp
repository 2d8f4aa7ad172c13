#pragma once

#include "credit/config/ledger_config.hpp"
#include "credit/domain/borrow_request.hpp"
#include "credit/domain/loan.hpp"
#include "credit/domain/repay_result.hpp"
#include "credit/domain/types.hpp"
#include "credit/eventbus/event_bus.hpp"
#include "credit/external/i_asset_custody.hpp"
#include "credit/external/i_reputation_hook.hpp"
#include "credit/interest/i_interest_model.hpp"
#include "credit/risk/i_risk_policy.hpp"
#include "credit/time/i_time_provider.hpp"

#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace credit {

// -----------------------------------------------------------------------------
// LoanLedger: loan state machine and custody orchestration
// -----------------------------------------------------------------------------
//
// @brief  Owns every Loan record, the per-borrower active-loan pointer and
//         the locked-collateral counters. All mutation of those goes through
//         open(), repay(), markDefault() and the admin setters.
//
// @details
// Loan lifecycle:
//
//   None --open()--> Active --repay() covering the debt--> Repaid
//                           \-markDefault() after due+grace--> Defaulted
//
// Collaborators:
//   IRiskPolicy      admission decision at open()             (required)
//   IInterestModel   debt at repay() / getDebt()              (required)
//   IAssetCustody    every movement of value                  (required)
//   IReputationHook  opened/repaid/defaulted notifications    (optional)
//   ITimeProvider    the only source of "now"
//   EventBus         post-commit notifications
//
// A required collaborator that is missing when an operation needs it raises
// LedgerError(DependencyUnavailable, ModuleNotConfigured). A missing hook
// means notifications are skipped.
//
// Atomicity:
//   Each mutating call validates every precondition first, then performs
//   its custody movements through a TransferJournal, then notifies the hook,
//   and only then writes the staged loan record and counters. Any exception
//   before the write (custody failure, hook rejection) unwinds the journal,
//   so neither the ledger nor custody balances change. Events are published
//   after the write; a subscriber that throws is logged and does not change
//   the outcome returned to the caller.
//
// Ordering and re-entry:
//   The ledger is single-threaded by contract; LedgerService serialises
//   calls. The pause flag is checked first in open/repay/markDefault, then a
//   re-entrancy guard rejects any mutating call made while another mutating
//   call on this instance is still running (e.g. from inside a hook).
//
// Collateral accounting:
//   lockedCollateral(asset) == sum of collateral_amount over Active loans
//   pledging that asset; lockedCollateral() is the total over all assets.
//   Free liquidity of an asset is the custody account's balance minus the
//   collateral locked in that asset. Collateral kept after a default is no
//   longer locked; it becomes ledger liquidity and is reported by
//   retainedCollateral(asset).
// -----------------------------------------------------------------------------
class LoanLedger {
 public:
  // ---------------------------------------------------------------------------
  // Constructor
  // ---------------------------------------------------------------------------
  //
  // @param  cfg       Fees, duration window, grace period and the admin,
  //                   treasury and custody account addresses. Validated;
  //                   throws LedgerError(InvalidInput, InvalidConfig).
  // @param  clock     Must outlive the ledger.
  // @param  bus       Must outlive the ledger.
  // @param  custody   May be null (every operation then fails with
  //                   DependencyUnavailable).
  // @param  risk      May be null until setRiskPolicy().
  // @param  interest  May be null until setInterestModel().
  // @param  hook      May be null.
  // ---------------------------------------------------------------------------
  LoanLedger(const config::LedgerConfig& cfg, const ITimeProvider& clock,
             EventBus& bus, std::shared_ptr<IAssetCustody> custody,
             std::shared_ptr<IRiskPolicy> risk,
             std::shared_ptr<IInterestModel> interest,
             std::shared_ptr<IReputationHook> hook = nullptr);

  LoanLedger(const LoanLedger&) = delete;
  LoanLedger& operator=(const LoanLedger&) = delete;
  LoanLedger(LoanLedger&&) = delete;
  LoanLedger& operator=(LoanLedger&&) = delete;

  // ---------------------------------------------------------------------------
  // open(borrower, request)
  // ---------------------------------------------------------------------------
  //
  // @brief  Admits, funds and records a new loan.
  //
  // @return The new loan id (ids start at 1 and are never reused).
  //
  // @details
  // Checks, in order:
  //   paused                                   StateConflict(Paused)
  //   re-entry                                 ReentrancyViolation
  //   empty borrower / asset, collateral
  //     amount without collateral asset        InvalidInput(ZeroAddress)
  //   amount == 0                              InvalidInput(ZeroAmount)
  //   duration outside [min, max]              InvalidInput(DurationOutOfBounds)
  //   borrower already has an Active loan      StateConflict(LoanAlreadyActive)
  //   risk policy / custody missing            DependencyUnavailable
  //   assessBorrow() not allowed, or amount
  //     above its max_borrow                   PolicyRejection(BorrowNotAllowed)
  //   free liquidity of asset < amount         ResourceExhaustion
  //
  // Then: escrows the collateral from the borrower, pays
  // amount - origination fee to the borrower and the fee to the treasury,
  // notifies onLoanOpened(), records the loan as Active with
  // due_ts = now + duration, and publishes LoanOpenedEvent.
  // ---------------------------------------------------------------------------
  domain::LoanId open(const domain::Address& borrower,
                      const domain::BorrowRequest& request);

  // ---------------------------------------------------------------------------
  // repay(payer, loan_id, amount)
  // ---------------------------------------------------------------------------
  //
  // @brief  Pulls amount from the payer (who must be the borrower) and
  //         credits it toward the loan's debt.
  //
  // @details
  // The debt is InterestModel::debtWithPenalty(principal, start, due, now).
  // When principal_repaid reaches it, the loan closes in the same call:
  //   - the overpayment is refunded and principal_repaid clamped to the debt
  //   - status -> Repaid, the borrower's active pointer is cleared
  //   - the collateral is returned to the borrower and unlocked
  //   - protocol_fee_bps of the interest part goes to the treasury
  // A partial payment only raises principal_repaid; due_ts is unchanged.
  //
  // onLoanRepaid(paid_net, total_repaid, total_debt, fully_repaid) is
  // called in both cases.
  //
  // Errors: Paused, Reentrancy, ZeroAmount, LoanNotFound, LoanNotActive,
  //         Unauthorized(NotBorrower), DependencyUnavailable.
  // ---------------------------------------------------------------------------
  domain::RepayResult repay(const domain::Address& payer,
                            domain::LoanId loan_id, domain::Amount amount);

  // ---------------------------------------------------------------------------
  // markDefault(keeper, loan_id)
  // ---------------------------------------------------------------------------
  //
  // @brief  Permissionless: anyone may default a loan once
  //         now > due_ts + grace_period_s.
  //
  // @return The bounty paid to the keeper.
  //
  // @details
  // Pays default_bounty_bps of the escrowed collateral to the keeper out of
  // that collateral, marks the loan Defaulted, clears the active pointer,
  // unlocks the collateral (the remainder stays in ledger custody) and
  // notifies onLoanDefaulted().
  //
  // Errors: Paused, Reentrancy, ZeroAddress, LoanNotFound, LoanNotActive,
  //         StateConflict(NotPastDue), DependencyUnavailable.
  // ---------------------------------------------------------------------------
  domain::Amount markDefault(const domain::Address& keeper,
                             domain::LoanId loan_id);

  // ---------------------------------------------------------------------------
  // Reads. Not gated by pause.
  // ---------------------------------------------------------------------------

  // Live debt (with penalty) of an Active loan; 0 for any other loan id.
  domain::Amount getDebt(domain::LoanId loan_id) const;

  std::optional<domain::Loan> loan(domain::LoanId loan_id) const;

  // kNoLoan when the borrower has no Active loan.
  domain::LoanId activeLoanOf(const domain::Address& borrower) const;

  // Copies of every loan ever opened, ordered by id.
  std::vector<domain::Loan> snapshot() const;

  domain::Amount lockedCollateral() const { return locked_total_; }
  domain::Amount lockedCollateral(const domain::AssetId& asset) const;
  domain::Amount retainedCollateral(const domain::AssetId& asset) const;

  // Custody balance of the ledger account minus locked collateral.
  domain::Amount freeLiquidity(const domain::AssetId& asset) const;

  bool isPaused() const { return paused_; }
  domain::LoanId nextLoanId() const { return next_id_; }
  const config::LedgerConfig& config() const { return cfg_; }

  // ---------------------------------------------------------------------------
  // Administration. Every setter rejects callers other than cfg.admin with
  // Unauthorized(NotAdmin) and invalid values with InvalidInput.
  // ---------------------------------------------------------------------------

  void setRiskPolicy(const domain::Address& caller,
                     std::shared_ptr<IRiskPolicy> risk);
  void setInterestModel(const domain::Address& caller,
                        std::shared_ptr<IInterestModel> interest);
  // nullptr disables notifications. A new hook is first told about every
  // Active loan through onLoanAdopted(); if that throws, the current hook
  // stays installed and the exception propagates.
  void setReputationHook(const domain::Address& caller,
                         std::shared_ptr<IReputationHook> hook);
  void setTreasury(const domain::Address& caller,
                   const domain::Address& treasury);
  void setFees(const domain::Address& caller,
               std::uint64_t origination_fee_bps,
               std::uint64_t protocol_fee_bps,
               std::uint64_t default_bounty_bps);
  void setDurationBounds(const domain::Address& caller,
                         std::uint64_t min_duration_s,
                         std::uint64_t max_duration_s);
  void setGracePeriod(const domain::Address& caller,
                      std::uint64_t grace_period_s);
  void pause(const domain::Address& caller);
  void unpause(const domain::Address& caller);

 private:
  // Sets the flag for the lifetime of a mutating call; throws
  // LedgerError(ReentrancyViolation) if it is already set.
  class ReentrancyGuard {
   public:
    explicit ReentrancyGuard(bool& entered);
    ~ReentrancyGuard() { entered_ = false; }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

   private:
    bool& entered_;
  };

  void requireNotPaused() const;
  void requireAdmin(const domain::Address& caller) const;
  IAssetCustody& custody() const;
  IRiskPolicy& riskPolicy() const;
  IInterestModel& interestModel() const;

  // Active loan by id or LedgerError(LoanNotFound / LoanNotActive).
  const domain::Loan& activeLoan(domain::LoanId loan_id) const;

  void lock(const domain::AssetId& asset, domain::Amount amount);
  void unlock(const domain::AssetId& asset, domain::Amount amount);

  // Publishes a committed change; subscriber failures are logged only.
  void notify(const Event& event);

  config::LedgerConfig cfg_;
  const ITimeProvider& clock_;
  EventBus& bus_;

  std::shared_ptr<IAssetCustody> custody_;
  std::shared_ptr<IRiskPolicy> risk_;
  std::shared_ptr<IInterestModel> interest_;
  std::shared_ptr<IReputationHook> hook_;

  std::map<domain::LoanId, domain::Loan> loans_;
  std::unordered_map<domain::Address, domain::LoanId> active_loan_of_;
  std::map<domain::AssetId, domain::Amount> locked_;
  std::map<domain::AssetId, domain::Amount> retained_;
  domain::Amount locked_total_{0};

  domain::LoanId next_id_{1};
  bool paused_{false};
  bool entered_{false};
};

}  // namespace credit
