#include "credit/ledger/loan_ledger.hpp"
#include "credit/config/config_loader.hpp"
#include "credit/errors/ledger_error.hpp"
#include "credit/ledger/transfer_journal.hpp"
#include "credit/math/mul_div.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace credit {

namespace {

constexpr domain::Amount kMaxAmount = std::numeric_limits<domain::Amount>::max();

std::string loanTag(domain::LoanId id) { return "loan " + std::to_string(id); }

}  // namespace

// -----------------------------------------------------------------------------
// ReentrancyGuard
// -----------------------------------------------------------------------------
LoanLedger::ReentrancyGuard::ReentrancyGuard(bool& entered)
    : entered_(entered) {
  if (entered_) {
    // Must not reset the flag in the destructor: the outer call owns it.
    throw LedgerError(ErrorKind::ReentrancyViolation, ErrorCode::Reentrancy,
                      "mutating call while another is in progress");
  }
  entered_ = true;
}

// -----------------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------------
LoanLedger::LoanLedger(const config::LedgerConfig& cfg,
                       const ITimeProvider& clock, EventBus& bus,
                       std::shared_ptr<IAssetCustody> custody,
                       std::shared_ptr<IRiskPolicy> risk,
                       std::shared_ptr<IInterestModel> interest,
                       std::shared_ptr<IReputationHook> hook)
    : cfg_(cfg),
      clock_(clock),
      bus_(bus),
      custody_(std::move(custody)),
      risk_(std::move(risk)),
      interest_(std::move(interest)),
      hook_(std::move(hook)) {
  config::validate(cfg_);
}

// -----------------------------------------------------------------------------
// Precondition helpers
// -----------------------------------------------------------------------------
void LoanLedger::requireNotPaused() const {
  if (paused_) {
    throw LedgerError(ErrorKind::StateConflict, ErrorCode::Paused,
                      "ledger is paused");
  }
}

void LoanLedger::requireAdmin(const domain::Address& caller) const {
  if (caller != cfg_.admin) {
    throw LedgerError(ErrorKind::Unauthorized, ErrorCode::NotAdmin,
                      "caller '" + caller + "' is not the ledger admin");
  }
}

void LoanLedger::notify(const Event& event) {
  try {
    bus_.publish(event);
  } catch (const std::exception& e) {
    std::cerr << "[LoanLedger] event subscriber failed: " << e.what() << "\n";
  }
}

IAssetCustody& LoanLedger::custody() const {
  if (!custody_) {
    throw LedgerError(ErrorKind::DependencyUnavailable,
                      ErrorCode::ModuleNotConfigured, "asset custody");
  }
  return *custody_;
}

IRiskPolicy& LoanLedger::riskPolicy() const {
  if (!risk_) {
    throw LedgerError(ErrorKind::DependencyUnavailable,
                      ErrorCode::ModuleNotConfigured, "risk policy");
  }
  return *risk_;
}

IInterestModel& LoanLedger::interestModel() const {
  if (!interest_) {
    throw LedgerError(ErrorKind::DependencyUnavailable,
                      ErrorCode::ModuleNotConfigured, "interest model");
  }
  return *interest_;
}

const domain::Loan& LoanLedger::activeLoan(domain::LoanId loan_id) const {
  auto it = loans_.find(loan_id);
  if (it == loans_.end()) {
    throw LedgerError(ErrorKind::StateConflict, ErrorCode::LoanNotFound,
                      loanTag(loan_id));
  }
  if (it->second.status != domain::LoanStatus::Active) {
    throw LedgerError(ErrorKind::StateConflict, ErrorCode::LoanNotActive,
                      loanTag(loan_id) + " is " +
                          domain::toString(it->second.status));
  }
  return it->second;
}

void LoanLedger::lock(const domain::AssetId& asset, domain::Amount amount) {
  if (amount == 0) {
    return;
  }
  locked_[asset] += amount;
  locked_total_ += amount;
}

void LoanLedger::unlock(const domain::AssetId& asset, domain::Amount amount) {
  if (amount == 0) {
    return;
  }
  auto it = locked_.find(asset);
  it->second -= amount;
  if (it->second == 0) {
    locked_.erase(it);
  }
  locked_total_ -= amount;
}

// -----------------------------------------------------------------------------
// open
// -----------------------------------------------------------------------------
domain::LoanId LoanLedger::open(const domain::Address& borrower,
                                const domain::BorrowRequest& request) {
  requireNotPaused();
  ReentrancyGuard guard(entered_);

  // --- Input validation -----------------------------------------------------
  if (borrower.empty() || request.asset.empty()) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::ZeroAddress,
                      "borrower and asset are required");
  }
  if (request.collateral_amount > 0 && request.collateral_asset.empty()) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::ZeroAddress,
                      "collateral amount given without collateral asset");
  }
  if (request.amount == 0) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::ZeroAmount,
                      "borrow amount must be non-zero");
  }
  if (request.duration_s < cfg_.min_duration_s ||
      request.duration_s > cfg_.max_duration_s) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::DurationOutOfBounds,
                      "duration " + std::to_string(request.duration_s) +
                          "s outside [" + std::to_string(cfg_.min_duration_s) +
                          ", " + std::to_string(cfg_.max_duration_s) + "]");
  }

  // --- State ----------------------------------------------------------------
  if (activeLoanOf(borrower) != domain::kNoLoan) {
    throw LedgerError(ErrorKind::StateConflict, ErrorCode::LoanAlreadyActive,
                      borrower + " already has " +
                          loanTag(activeLoanOf(borrower)));
  }

  IAssetCustody& assets = custody();

  // --- Risk policy ----------------------------------------------------------
  domain::RiskResult risk = riskPolicy().assessBorrow(borrower, request);
  if (!risk.allowed || request.amount > risk.max_borrow) {
    std::cerr << "[LoanLedger] borrow rejected for " << borrower << ": "
              << domain::toString(risk.reason) << " (amount="
              << request.amount << ", max_borrow=" << risk.max_borrow
              << ", ratio_bps=" << risk.collateral_ratio_bps << ")\n";
    throw LedgerError(risk, "borrow by " + borrower + " not allowed");
  }

  // --- Liquidity ------------------------------------------------------------
  domain::Amount free = freeLiquidity(request.asset);
  if (free < request.amount) {
    throw LedgerError(ErrorKind::ResourceExhaustion,
                      ErrorCode::InsufficientLiquidity,
                      "free " + request.asset + " liquidity " +
                          std::to_string(free) + " < " +
                          std::to_string(request.amount));
  }

  const domain::Timestamp now = clock_.now_s();
  if (now > kMaxAmount - request.duration_s) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::DurationOutOfBounds,
                      "due date overflows");
  }

  const domain::Amount fee = bps_of(request.amount, cfg_.origination_fee_bps);
  const domain::LoanId id = next_id_;

  domain::Loan loan;
  loan.id = id;
  loan.borrower = borrower;
  loan.asset = request.asset;
  loan.collateral_asset = request.collateral_asset;
  loan.principal = request.amount;
  loan.principal_repaid = 0;
  loan.collateral_amount = request.collateral_amount;
  loan.start_ts = now;
  loan.due_ts = now + request.duration_s;
  loan.status = domain::LoanStatus::Active;

  // --- Custody movements (undone if anything below throws) ------------------
  TransferJournal journal(assets);
  journal.transfer(loan.collateral_asset, borrower, cfg_.custody_account,
                   loan.collateral_amount);
  journal.transfer(loan.asset, cfg_.custody_account, borrower,
                   request.amount - fee);
  journal.transfer(loan.asset, cfg_.custody_account, cfg_.treasury, fee);

  if (hook_) {
    hook_->onLoanOpened(id, borrower);
  }

  // --- Commit ---------------------------------------------------------------
  loans_.emplace(id, loan);
  active_loan_of_[borrower] = id;
  lock(loan.collateral_asset, loan.collateral_amount);
  ++next_id_;
  journal.commit();

  std::cout << "[LoanLedger] opened " << loanTag(id) << " for " << borrower
            << ": " << loan.principal << " " << loan.asset << " (fee " << fee
            << "), collateral " << loan.collateral_amount << " "
            << loan.collateral_asset << ", due " << loan.due_ts << "\n";

  LoanOpenedEvent event;
  event.loan_id = id;
  event.borrower = borrower;
  event.asset = loan.asset;
  event.principal = loan.principal;
  event.origination_fee = fee;
  event.collateral_asset = loan.collateral_asset;
  event.collateral_amount = loan.collateral_amount;
  event.start_ts = loan.start_ts;
  event.due_ts = loan.due_ts;
  notify(event);

  return id;
}

// -----------------------------------------------------------------------------
// repay
// -----------------------------------------------------------------------------
domain::RepayResult LoanLedger::repay(const domain::Address& payer,
                                      domain::LoanId loan_id,
                                      domain::Amount amount) {
  requireNotPaused();
  ReentrancyGuard guard(entered_);

  if (amount == 0) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::ZeroAmount,
                      "repay amount must be non-zero");
  }

  const domain::Loan& current = activeLoan(loan_id);
  if (payer != current.borrower) {
    throw LedgerError(ErrorKind::Unauthorized, ErrorCode::NotBorrower,
                      payer + " is not the borrower of " + loanTag(loan_id));
  }

  IAssetCustody& assets = custody();
  IInterestModel& model = interestModel();

  if (current.principal_repaid > kMaxAmount - amount) {
    throw std::overflow_error("repay amount overflows total repaid");
  }

  const domain::Timestamp now = clock_.now_s();
  const domain::Amount total_debt = model.debtWithPenalty(
      current.principal, current.start_ts, current.due_ts, now);

  domain::Loan staged = current;
  staged.principal_repaid += amount;

  TransferJournal journal(assets);
  journal.transfer(staged.asset, payer, cfg_.custody_account, amount);

  domain::RepayResult result;
  domain::Amount refund = 0;
  domain::Amount protocol_fee = 0;

  if (staged.principal_repaid >= total_debt) {
    // --- Full repayment: close the loan -------------------------------------
    refund = staged.principal_repaid - total_debt;
    journal.transfer(staged.asset, cfg_.custody_account, payer, refund);
    staged.principal_repaid = total_debt;
    staged.status = domain::LoanStatus::Repaid;

    journal.transfer(staged.collateral_asset, cfg_.custody_account,
                     staged.borrower, staged.collateral_amount);

    const domain::Amount interest =
        total_debt > staged.principal ? total_debt - staged.principal : 0;
    protocol_fee = bps_of(interest, cfg_.protocol_fee_bps);
    journal.transfer(staged.asset, cfg_.custody_account, cfg_.treasury,
                     protocol_fee);

    result.fully_repaid = true;
  }

  result.paid_net = amount - refund;
  result.total_repaid = staged.principal_repaid;
  result.total_debt = total_debt;

  if (hook_) {
    hook_->onLoanRepaid(loan_id, staged.borrower, result.paid_net,
                        result.total_repaid, result.total_debt,
                        result.fully_repaid);
  }

  // --- Commit ---------------------------------------------------------------
  if (result.fully_repaid) {
    active_loan_of_.erase(staged.borrower);
    unlock(staged.collateral_asset, staged.collateral_amount);
  }
  loans_[loan_id] = staged;
  journal.commit();

  std::cout << "[LoanLedger] " << loanTag(loan_id) << " repayment "
            << result.paid_net << " " << staged.asset << ": "
            << result.total_repaid << "/" << result.total_debt
            << (result.fully_repaid ? " (closed)" : "") << "\n";

  LoanRepaidEvent event;
  event.loan_id = loan_id;
  event.borrower = staged.borrower;
  event.paid_net = result.paid_net;
  event.refund = refund;
  event.total_repaid = result.total_repaid;
  event.total_debt = result.total_debt;
  event.protocol_fee = protocol_fee;
  event.fully_repaid = result.fully_repaid;
  event.timestamp = now;
  notify(event);

  return result;
}

// -----------------------------------------------------------------------------
// markDefault
// -----------------------------------------------------------------------------
domain::Amount LoanLedger::markDefault(const domain::Address& keeper,
                                       domain::LoanId loan_id) {
  requireNotPaused();
  ReentrancyGuard guard(entered_);

  if (keeper.empty()) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::ZeroAddress,
                      "keeper address is required");
  }

  const domain::Loan& current = activeLoan(loan_id);

  const domain::Timestamp now = clock_.now_s();
  const domain::Timestamp deadline =
      current.due_ts > kMaxAmount - cfg_.grace_period_s
          ? kMaxAmount
          : current.due_ts + cfg_.grace_period_s;
  if (now <= deadline) {
    throw LedgerError(ErrorKind::StateConflict, ErrorCode::NotPastDue,
                      loanTag(loan_id) + " is due until " +
                          std::to_string(deadline) + ", now " +
                          std::to_string(now));
  }

  IAssetCustody& assets = custody();
  const domain::Amount debt = interestModel().debtWithPenalty(
      current.principal, current.start_ts, current.due_ts, now);

  domain::Loan staged = current;
  staged.status = domain::LoanStatus::Defaulted;

  const domain::Amount bounty =
      bps_of(staged.collateral_amount, cfg_.default_bounty_bps);

  TransferJournal journal(assets);
  journal.transfer(staged.collateral_asset, cfg_.custody_account, keeper,
                   bounty);

  if (hook_) {
    hook_->onLoanDefaulted(loan_id, staged.borrower);
  }

  // --- Commit ---------------------------------------------------------------
  const domain::Amount retained = staged.collateral_amount - bounty;
  active_loan_of_.erase(staged.borrower);
  unlock(staged.collateral_asset, staged.collateral_amount);
  if (retained > 0) {
    retained_[staged.collateral_asset] += retained;
  }
  loans_[loan_id] = staged;
  journal.commit();

  std::cout << "[LoanLedger] " << loanTag(loan_id) << " of "
            << staged.borrower << " defaulted by " << keeper << ": bounty "
            << bounty << ", retained " << retained << " "
            << staged.collateral_asset << ", debt " << debt << "\n";

  LoanDefaultedEvent event;
  event.loan_id = loan_id;
  event.borrower = staged.borrower;
  event.keeper = keeper;
  event.bounty = bounty;
  event.collateral_retained = retained;
  event.debt_at_default = debt;
  event.timestamp = now;
  notify(event);

  return bounty;
}

// -----------------------------------------------------------------------------
// Reads
// -----------------------------------------------------------------------------
domain::Amount LoanLedger::getDebt(domain::LoanId loan_id) const {
  auto it = loans_.find(loan_id);
  if (it == loans_.end() ||
      it->second.status != domain::LoanStatus::Active) {
    return 0;
  }
  const domain::Loan& l = it->second;
  return interestModel().debtWithPenalty(l.principal, l.start_ts, l.due_ts,
                                         clock_.now_s());
}

std::optional<domain::Loan> LoanLedger::loan(domain::LoanId loan_id) const {
  auto it = loans_.find(loan_id);
  if (it == loans_.end()) {
    return std::nullopt;
  }
  return it->second;
}

domain::LoanId LoanLedger::activeLoanOf(const domain::Address& borrower) const {
  auto it = active_loan_of_.find(borrower);
  return (it == active_loan_of_.end()) ? domain::kNoLoan : it->second;
}

std::vector<domain::Loan> LoanLedger::snapshot() const {
  std::vector<domain::Loan> out;
  out.reserve(loans_.size());
  for (const auto& [id, l] : loans_) {
    out.push_back(l);
  }
  return out;
}

domain::Amount LoanLedger::lockedCollateral(
    const domain::AssetId& asset) const {
  auto it = locked_.find(asset);
  return (it == locked_.end()) ? 0 : it->second;
}

domain::Amount LoanLedger::retainedCollateral(
    const domain::AssetId& asset) const {
  auto it = retained_.find(asset);
  return (it == retained_.end()) ? 0 : it->second;
}

domain::Amount LoanLedger::freeLiquidity(const domain::AssetId& asset) const {
  domain::Amount balance = custody().balanceOf(asset, cfg_.custody_account);
  domain::Amount locked = lockedCollateral(asset);
  return balance > locked ? balance - locked : 0;
}

// -----------------------------------------------------------------------------
// Administration
// -----------------------------------------------------------------------------
void LoanLedger::setRiskPolicy(const domain::Address& caller,
                               std::shared_ptr<IRiskPolicy> risk) {
  ReentrancyGuard guard(entered_);
  requireAdmin(caller);
  if (!risk) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::InvalidConfig,
                      "risk policy must not be null");
  }
  risk_ = std::move(risk);
  std::cout << "[LoanLedger] risk policy replaced by " << caller << "\n";
}

void LoanLedger::setInterestModel(const domain::Address& caller,
                                  std::shared_ptr<IInterestModel> interest) {
  ReentrancyGuard guard(entered_);
  requireAdmin(caller);
  if (!interest) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::InvalidConfig,
                      "interest model must not be null");
  }
  interest_ = std::move(interest);
  std::cout << "[LoanLedger] interest model replaced by " << caller << "\n";
}

void LoanLedger::setReputationHook(const domain::Address& caller,
                                   std::shared_ptr<IReputationHook> hook) {
  ReentrancyGuard guard(entered_);
  requireAdmin(caller);
  if (hook) {
    for (const auto& [id, loan] : loans_) {
      if (loan.status == domain::LoanStatus::Active) {
        hook->onLoanAdopted(id, loan.borrower);
      }
    }
  }
  hook_ = std::move(hook);
  std::cout << "[LoanLedger] reputation hook "
            << (hook_ ? "replaced" : "removed") << " by " << caller << "\n";
}

void LoanLedger::setTreasury(const domain::Address& caller,
                             const domain::Address& treasury) {
  ReentrancyGuard guard(entered_);
  requireAdmin(caller);
  config::LedgerConfig next = cfg_;
  next.treasury = treasury;
  config::validate(next);
  cfg_ = std::move(next);
}

void LoanLedger::setFees(const domain::Address& caller,
                         std::uint64_t origination_fee_bps,
                         std::uint64_t protocol_fee_bps,
                         std::uint64_t default_bounty_bps) {
  ReentrancyGuard guard(entered_);
  requireAdmin(caller);
  config::LedgerConfig next = cfg_;
  next.origination_fee_bps = origination_fee_bps;
  next.protocol_fee_bps = protocol_fee_bps;
  next.default_bounty_bps = default_bounty_bps;
  config::validate(next);
  cfg_ = std::move(next);
}

void LoanLedger::setDurationBounds(const domain::Address& caller,
                                   std::uint64_t min_duration_s,
                                   std::uint64_t max_duration_s) {
  ReentrancyGuard guard(entered_);
  requireAdmin(caller);
  config::LedgerConfig next = cfg_;
  next.min_duration_s = min_duration_s;
  next.max_duration_s = max_duration_s;
  config::validate(next);
  cfg_ = std::move(next);
}

void LoanLedger::setGracePeriod(const domain::Address& caller,
                                std::uint64_t grace_period_s) {
  ReentrancyGuard guard(entered_);
  requireAdmin(caller);
  cfg_.grace_period_s = grace_period_s;
}

void LoanLedger::pause(const domain::Address& caller) {
  ReentrancyGuard guard(entered_);
  requireAdmin(caller);
  if (paused_) {
    return;
  }
  paused_ = true;
  std::cerr << "[LoanLedger] PAUSED by " << caller << "\n";
  notify(LedgerPausedEvent{true, caller, clock_.now_s()});
}

void LoanLedger::unpause(const domain::Address& caller) {
  ReentrancyGuard guard(entered_);
  requireAdmin(caller);
  if (!paused_) {
    return;
  }
  paused_ = false;
  std::cout << "[LoanLedger] unpaused by " << caller << "\n";
  notify(LedgerPausedEvent{false, caller, clock_.now_s()});
}

}  // namespace credit
