#pragma once

#include "credit/config/ledger_config.hpp"
#include "credit/external/i_price_feed.hpp"
#include "credit/external/i_proof_verifier.hpp"
#include "credit/external/i_reputation_store.hpp"
#include "credit/risk/i_risk_policy.hpp"

#include <memory>

namespace credit {

// -----------------------------------------------------------------------------
// RiskPolicy: reputation-laddered collateral requirement
// -----------------------------------------------------------------------------
//
// @brief  Maps a borrower's reputation to a required collateral ratio and
//         decides whether a borrow request is admissible.
//
// @details
// Collateral ladder (ceiling division, so no score reaches a cheaper tier
// early):
//
//   ratio(s) = ceil(max_ratio_bps * (score_free - s) / score_free)  s < free
//   ratio(s) = 0                                                     s >= free
//
// assessBorrow() evaluates, stopping at the first failure:
//
//   1. Badge holder                         -> Defaulter
//   2. Proof required and absent            -> MissingProof
//      Proof present and not verified       -> BadProof
//   3. ratio == 0: allow up to no_collateral_ceiling (Limit above it)
//   4. collateral_amount == 0 or no asset   -> NoCollateral
//      Asset outside collateral_assets      -> UnsupportedCollateral
//      No price feed                        -> NoOracle
//      Pair unknown / price 0 / feed throws -> BadPrice
//      max_borrow = value_in_debt_asset * 10000 / ratio
//   5. amount > max_borrow                  -> Limit (max_borrow reported)
//
// A proof is checked only when require_proof is set, or when the request
// carries one anyway (so a bad proof is never silently accepted).
//
// When the collateral asset equals the debt asset, its value is taken at
// par and no price lookup happens.
//
// Missing optional collaborators (all held as nullable shared_ptr):
//   reputation store  -> every score is 0 and nobody is a defaulter
//   price feed        -> NoOracle for any cross-asset collateral
//   proof verifier    -> every proof is BadProof
//
// A collaborator that throws is logged and degrades to a rejection; it
// never escapes assessBorrow().
//
// Thread-safety: const methods are safe to call concurrently as long as the
// collaborators are; setters are not.
// -----------------------------------------------------------------------------
class RiskPolicy final : public IRiskPolicy {
 public:
  RiskPolicy(const config::RiskPolicyConfig& cfg,
             std::shared_ptr<const IReputationStore> reputation,
             std::shared_ptr<const IPriceFeed> price_feed,
             std::shared_ptr<const IProofVerifier> verifier);

  std::uint64_t collateralRatioBps(
      const domain::Address& borrower) const override;

  bool isDefaulter(const domain::Address& borrower) const override;

  domain::RiskResult assessBorrow(
      const domain::Address& borrower,
      const domain::BorrowRequest& request) const override;

  // Ladder evaluation for an explicit score; independent of any store.
  std::uint64_t ratioForScore(domain::Score score) const;

  void setReputationStore(std::shared_ptr<const IReputationStore> store);
  void setPriceFeed(std::shared_ptr<const IPriceFeed> feed);
  void setProofVerifier(std::shared_ptr<const IProofVerifier> verifier);

  const config::RiskPolicyConfig& config() const { return cfg_; }

 private:
  // Proof step. Returns Ok when the request passes.
  domain::RiskReason checkProof(const domain::Address& borrower,
                                const domain::BorrowRequest& request) const;

  // Value of the pledged collateral expressed in the debt asset, or the
  // rejection reason when it cannot be determined.
  domain::RiskReason collateralValue(const domain::BorrowRequest& request,
                                     domain::Amount& value_out) const;

  config::RiskPolicyConfig cfg_;
  std::shared_ptr<const IReputationStore> reputation_;
  std::shared_ptr<const IPriceFeed> price_feed_;
  std::shared_ptr<const IProofVerifier> verifier_;
};

}  // namespace credit
