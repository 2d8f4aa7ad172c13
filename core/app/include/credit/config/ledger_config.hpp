#pragma once

#include "credit/domain/types.hpp"

#include <cstdint>
#include <set>
#include <string>

namespace credit {
namespace config {

// -----------------------------------------------------------------------------
// InterestConfig: rates for InterestAccrualModel
// -----------------------------------------------------------------------------
//
// Both rates are annual, in basis points, and fixed for the lifetime of a
// model instance. A zero rate is legal and accrues nothing.
// -----------------------------------------------------------------------------
struct InterestConfig {
  std::uint64_t apr_bps{1000};          // 10% before the due date
  std::uint64_t penalty_apr_bps{2500};  // 25% after the due date
};

// -----------------------------------------------------------------------------
// RiskPolicyConfig: collateral ladder and admission thresholds
// -----------------------------------------------------------------------------
//
// @details
// The required collateral ratio falls linearly from max_ratio_bps at score 0
// to 0 at score_free. Borrowers at or above score_free borrow without
// collateral, up to no_collateral_ceiling.
//
// collateral_assets is the set of assets accepted as collateral. An empty
// set accepts any asset.
// -----------------------------------------------------------------------------
struct RiskPolicyConfig {
  std::uint64_t max_ratio_bps{15000};
  domain::Score score_free{800};
  domain::Amount no_collateral_ceiling{0};
  bool require_proof{false};
  std::set<domain::AssetId> collateral_assets;
};

// ScoreReputationHook parameters.
struct ReputationConfig {
  domain::Score score_step{50};  // added on every full repayment
  domain::Score max_score{1000};
  bool strict{false};  // reject notifications for loans never seen opened
};

// -----------------------------------------------------------------------------
// LedgerConfig: LoanLedger parameters
// -----------------------------------------------------------------------------
//
// @details
// custody_account is the address under which the ledger holds escrowed
// collateral and lendable liquidity in IAssetCustody.
//
// Fee fields are basis points:
//   origination_fee_bps  share of the borrowed amount sent to treasury at open
//   protocol_fee_bps     share of accrued interest sent to treasury at repay
//   default_bounty_bps   share of collateral paid to whoever marks a default
// -----------------------------------------------------------------------------
struct LedgerConfig {
  domain::Address admin{"admin"};
  domain::Address treasury{"treasury"};
  domain::Address custody_account{"ledger"};
  std::uint64_t origination_fee_bps{0};
  std::uint64_t protocol_fee_bps{0};
  std::uint64_t default_bounty_bps{0};
  std::uint64_t min_duration_s{86400};
  std::uint64_t max_duration_s{365ULL * 86400ULL};
  std::uint64_t grace_period_s{0};
};

// Everything the credit_ledger executable reads from its config file.
struct AppConfig {
  LedgerConfig ledger;
  RiskPolicyConfig risk;
  InterestConfig interest;
  ReputationConfig reputation;
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
  domain::Timestamp sim_start_s{0};  // 0 = use the wall clock
};

}  // namespace config
}  // namespace credit
