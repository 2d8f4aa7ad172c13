// =============================================================================
// ledger_fixture.hpp
// =============================================================================
// Shared GoogleTest fixture for LoanLedger tests: a simulation clock, in-memory
// custody / reputation / prices / proofs, the real RiskPolicy and
// InterestAccrualModel, and a LoanLedger wired to all of them.
//
// Starting balances:
//   ledger  10,000,000 USDC    lendable liquidity
//   alice    2,000,000 USDC    collateral + repayments
//   alice           10 WETH
//
// Policy: max ratio 150% at score 0, free at 800, unsecured ceiling 5,000.
// Interest: 10% APR, 25% penalty APR. Durations 1..365 days, no grace.
// =============================================================================

#pragma once

#include "credit/config/ledger_config.hpp"
#include "credit/domain/borrow_request.hpp"
#include "credit/errors/ledger_error.hpp"
#include "credit/eventbus/event_bus.hpp"
#include "credit/external/allow_list_proof_verifier.hpp"
#include "credit/external/in_memory_asset_custody.hpp"
#include "credit/external/in_memory_reputation_store.hpp"
#include "credit/external/score_reputation_hook.hpp"
#include "credit/external/static_price_feed.hpp"
#include "credit/interest/interest_accrual_model.hpp"
#include "credit/ledger/loan_ledger.hpp"
#include "credit/risk/risk_policy.hpp"
#include "credit/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <string>

namespace credit_test {

inline constexpr std::uint64_t kDay = 86400;
inline constexpr credit::domain::Timestamp kStart = 1'000'000;

// Runs fn, expects a LedgerError, and returns it for further inspection.
inline credit::LedgerError expectLedgerError(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const credit::LedgerError& e) {
    return e;
  }
  ADD_FAILURE() << "expected LedgerError";
  return credit::LedgerError(credit::ErrorKind::InvalidInput,
                             credit::ErrorCode::InvalidConfig,
                             "no error thrown");
}

class LedgerFixture : public ::testing::Test {
 protected:
  LedgerFixture() : clock(kStart) {
    ledger_cfg.admin = "admin";
    ledger_cfg.treasury = "treasury";
    ledger_cfg.custody_account = "ledger";
    ledger_cfg.min_duration_s = kDay;
    ledger_cfg.max_duration_s = 365 * kDay;

    risk_cfg.max_ratio_bps = 15000;
    risk_cfg.score_free = 800;
    risk_cfg.no_collateral_ceiling = 5000;

    rep_cfg.score_step = 50;
    rep_cfg.max_score = 1000;

    custody = std::make_shared<credit::InMemoryAssetCustody>();
    store = std::make_shared<credit::InMemoryReputationStore>(1000);
    prices = std::make_shared<credit::StaticPriceFeed>();
    proofs = std::make_shared<credit::AllowListProofVerifier>();
    hook = std::make_shared<credit::ScoreReputationHook>(store, rep_cfg);
    policy = std::make_shared<credit::RiskPolicy>(risk_cfg, store, prices,
                                                  proofs);
    interest = std::make_shared<credit::InterestAccrualModel>(1000, 2500);

    custody->credit("USDC", "ledger", 10'000'000);
    custody->credit("USDC", "alice", 2'000'000);
    custody->credit("WETH", "alice", 10);
    prices->setPrice("WETH", "USDC", credit::PriceQuote{2000, 0});

    ledger = std::make_unique<credit::LoanLedger>(
        ledger_cfg, clock, bus, custody, policy, interest, hook);
  }

  static credit::domain::BorrowRequest request(
      credit::domain::Amount amount, const std::string& collateral_asset,
      credit::domain::Amount collateral, std::uint64_t duration = 30 * kDay) {
    credit::domain::BorrowRequest r;
    r.asset = "USDC";
    r.amount = amount;
    r.collateral_asset = collateral_asset;
    r.collateral_amount = collateral;
    r.duration_s = duration;
    return r;
  }

  credit::domain::Amount balance(const std::string& asset,
                                 const std::string& owner) const {
    return custody->balanceOf(asset, owner);
  }

  credit::config::LedgerConfig ledger_cfg;
  credit::config::RiskPolicyConfig risk_cfg;
  credit::config::ReputationConfig rep_cfg;

  credit::SimulationTimeProvider clock;
  credit::EventBus bus;

  std::shared_ptr<credit::InMemoryAssetCustody> custody;
  std::shared_ptr<credit::InMemoryReputationStore> store;
  std::shared_ptr<credit::StaticPriceFeed> prices;
  std::shared_ptr<credit::AllowListProofVerifier> proofs;
  std::shared_ptr<credit::ScoreReputationHook> hook;
  std::shared_ptr<credit::RiskPolicy> policy;
  std::shared_ptr<credit::InterestAccrualModel> interest;

  std::unique_ptr<credit::LoanLedger> ledger;
};

}  // namespace credit_test
