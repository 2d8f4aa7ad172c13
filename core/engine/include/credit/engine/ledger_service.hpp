#pragma once

#include "credit/config/ledger_config.hpp"
#include "credit/eventbus/event_bus.hpp"
#include "credit/external/allow_list_proof_verifier.hpp"
#include "credit/external/in_memory_asset_custody.hpp"
#include "credit/external/in_memory_reputation_store.hpp"
#include "credit/external/score_reputation_hook.hpp"
#include "credit/external/static_price_feed.hpp"
#include "credit/interest/interest_accrual_model.hpp"
#include "credit/ledger/loan_ledger.hpp"
#include "credit/network/ipc_server.hpp"
#include "credit/risk/risk_policy.hpp"
#include "credit/time/i_time_provider.hpp"
#include "credit/time/simulation_time_provider.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace credit {

// -----------------------------------------------------------------------------
// LedgerService: wires a LoanLedger to in-memory collaborators and IPC
// -----------------------------------------------------------------------------
//
// @brief  Top-level object of the credit_ledger executable.
//
// @details
// Construction builds, from one AppConfig:
//   clock        SimulationTimeProvider when sim_start_s != 0, otherwise
//                LiveTimeProvider
//   custody      InMemoryAssetCustody
//   reputation   InMemoryReputationStore + ScoreReputationHook
//   prices       StaticPriceFeed
//   proofs       AllowListProofVerifier
//   policy       RiskPolicy, InterestAccrualModel
//   ledger       LoanLedger over all of the above
//
// start() additionally brings up an IpcServer (if both endpoints are
// non-empty) whose command handler is executeCommand() and whose PUB socket
// receives every ledger event.
//
// Ordering:
//   executeCommand() holds a mutex for the whole command, so the ledger sees
//   one operation at a time no matter how many threads submit commands.
//
// Command protocol (one JSON object per request, "cmd" selects the action):
//   PING, STATUS,
//   DEPOSIT {caller, owner, asset, amount}         admin: mint into custody
//   BALANCE {owner, asset}
//   SET_PRICE {caller, base, quote, price, decimals}
//   SET_SCORE {caller, address, score}
//   REGISTER_PROOF {caller, borrower, token}
//   ASSESS / OPEN {borrower, asset, amount, collateral_asset,
//                  collateral_amount, duration_s, proof?}
//   REPAY {payer, loan_id, amount}
//   DEFAULT {keeper, loan_id}
//   LOAN {loan_id}, DEBT {loan_id}
//   SET_FEES {caller, origination_fee_bps, protocol_fee_bps,
//             default_bounty_bps}
//   PAUSE / UNPAUSE {caller}
//   ADVANCE_TIME {seconds}                         simulation clock only
//
// Replies are {"status":"ok", ...} or
// {"status":"error","kind":...,"code":...,"message":...}.
// -----------------------------------------------------------------------------
class LedgerService {
 public:
  explicit LedgerService(const config::AppConfig& cfg);

  ~LedgerService();

  LedgerService(const LedgerService&) = delete;
  LedgerService& operator=(const LedgerService&) = delete;
  LedgerService(LedgerService&&) = delete;
  LedgerService& operator=(LedgerService&&) = delete;

  // Idempotent.
  void start();

  // Idempotent; also called by the destructor.
  void stop();

  // Parses one JSON command and returns the JSON reply. Never throws for a
  // bad request; failures are reported in the reply.
  std::string executeCommand(const std::string& request);

  LoanLedger& ledger() { return *ledger_; }
  EventBus& eventBus() { return bus_; }
  InMemoryAssetCustody& custody() { return *custody_; }
  InMemoryReputationStore& reputation() { return *reputation_; }
  StaticPriceFeed& priceFeed() { return *price_feed_; }
  AllowListProofVerifier& proofVerifier() { return *verifier_; }

  // nullptr when running on the wall clock.
  SimulationTimeProvider* simClock() { return sim_clock_; }

 private:
  config::AppConfig cfg_;

  std::unique_ptr<ITimeProvider> clock_;
  SimulationTimeProvider* sim_clock_{nullptr};  // aliases clock_ if simulated

  EventBus bus_;

  std::shared_ptr<InMemoryAssetCustody> custody_;
  std::shared_ptr<InMemoryReputationStore> reputation_;
  std::shared_ptr<StaticPriceFeed> price_feed_;
  std::shared_ptr<AllowListProofVerifier> verifier_;
  std::shared_ptr<ScoreReputationHook> hook_;
  std::shared_ptr<RiskPolicy> risk_policy_;
  std::shared_ptr<InterestAccrualModel> interest_model_;

  std::unique_ptr<LoanLedger> ledger_;
  std::unique_ptr<IpcServer> ipc_server_;
  EventBus::SubscriptionId telemetry_sub_id_{0};

  std::mutex command_mutex_;
  bool running_{false};
};

}  // namespace credit
