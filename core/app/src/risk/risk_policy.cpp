#include "credit/risk/risk_policy.hpp"
#include "credit/math/mul_div.hpp"

#include <exception>
#include <iostream>
#include <limits>
#include <utility>

namespace credit {

namespace {

constexpr std::uint32_t kMaxPriceDecimals = 19;  // 10^19 < 2^64

domain::Amount saturatingMulDiv(std::uint64_t a, std::uint64_t b,
                                std::uint64_t denominator) {
  try {
    return mul_div(a, b, denominator);
  } catch (const std::overflow_error&) {
    return std::numeric_limits<domain::Amount>::max();
  }
}

std::uint64_t pow10(std::uint32_t exponent) {
  std::uint64_t result = 1;
  for (std::uint32_t i = 0; i < exponent; ++i) {
    result *= 10;
  }
  return result;
}

domain::RiskResult reject(domain::RiskReason reason, std::uint64_t ratio_bps,
                          domain::Amount max_borrow = 0) {
  domain::RiskResult r;
  r.allowed = false;
  r.collateral_ratio_bps = ratio_bps;
  r.max_borrow = max_borrow;
  r.reason = reason;
  return r;
}

}  // namespace

RiskPolicy::RiskPolicy(const config::RiskPolicyConfig& cfg,
                       std::shared_ptr<const IReputationStore> reputation,
                       std::shared_ptr<const IPriceFeed> price_feed,
                       std::shared_ptr<const IProofVerifier> verifier)
    : cfg_(cfg),
      reputation_(std::move(reputation)),
      price_feed_(std::move(price_feed)),
      verifier_(std::move(verifier)) {}

std::uint64_t RiskPolicy::ratioForScore(domain::Score score) const {
  if (score >= cfg_.score_free) {
    return 0;
  }
  return mul_div_ceil(cfg_.max_ratio_bps, cfg_.score_free - score,
                      cfg_.score_free);
}

std::uint64_t RiskPolicy::collateralRatioBps(
    const domain::Address& borrower) const {
  domain::Score score = reputation_ ? reputation_->scoreOf(borrower) : 0;
  return ratioForScore(score);
}

bool RiskPolicy::isDefaulter(const domain::Address& borrower) const {
  if (!reputation_) {
    return false;
  }
  return reputation_->hasBadge(borrower);
}

domain::RiskReason RiskPolicy::checkProof(
    const domain::Address& borrower,
    const domain::BorrowRequest& request) const {
  const bool has_proof = request.proof.has_value() && !request.proof->empty();

  if (!has_proof) {
    return cfg_.require_proof ? domain::RiskReason::MissingProof
                              : domain::RiskReason::Ok;
  }

  if (!verifier_) {
    std::cerr << "[RiskPolicy] proof supplied by " << borrower
              << " but no verifier is configured\n";
    return domain::RiskReason::BadProof;
  }

  try {
    return verifier_->verify(borrower, *request.proof)
               ? domain::RiskReason::Ok
               : domain::RiskReason::BadProof;
  } catch (const std::exception& e) {
    std::cerr << "[RiskPolicy] proof verifier failed for " << borrower
              << ": " << e.what() << "\n";
    return domain::RiskReason::BadProof;
  }
}

domain::RiskReason RiskPolicy::collateralValue(
    const domain::BorrowRequest& request, domain::Amount& value_out) const {
  if (request.collateral_amount == 0 || request.collateral_asset.empty()) {
    return domain::RiskReason::NoCollateral;
  }
  if (!cfg_.collateral_assets.empty() &&
      cfg_.collateral_assets.count(request.collateral_asset) == 0) {
    return domain::RiskReason::UnsupportedCollateral;
  }

  if (request.collateral_asset == request.asset) {
    value_out = request.collateral_amount;
    return domain::RiskReason::Ok;
  }

  if (!price_feed_) {
    return domain::RiskReason::NoOracle;
  }

  std::optional<PriceQuote> quote;
  try {
    quote = price_feed_->getPrice(request.collateral_asset, request.asset);
  } catch (const std::exception& e) {
    std::cerr << "[RiskPolicy] price feed failed for "
              << request.collateral_asset << "/" << request.asset << ": "
              << e.what() << "\n";
    return domain::RiskReason::BadPrice;
  }

  if (!quote || quote->price == 0 || quote->decimals > kMaxPriceDecimals) {
    return domain::RiskReason::BadPrice;
  }

  value_out = saturatingMulDiv(request.collateral_amount, quote->price,
                               pow10(quote->decimals));
  return domain::RiskReason::Ok;
}

domain::RiskResult RiskPolicy::assessBorrow(
    const domain::Address& borrower,
    const domain::BorrowRequest& request) const {
  // --- 1. Defaulters never borrow again -------------------------------------
  if (isDefaulter(borrower)) {
    return reject(domain::RiskReason::Defaulter, 0);
  }

  // --- 2. Identity proof ----------------------------------------------------
  domain::RiskReason proof = checkProof(borrower, request);
  if (proof != domain::RiskReason::Ok) {
    return reject(proof, 0);
  }

  const std::uint64_t ratio = collateralRatioBps(borrower);

  // --- 3. Top tier: unsecured up to a flat ceiling --------------------------
  domain::Amount max_borrow = 0;
  if (ratio == 0) {
    max_borrow = cfg_.no_collateral_ceiling;
  } else {
    // --- 4. Collateralised: value the pledge in the debt asset --------------
    domain::Amount value = 0;
    domain::RiskReason valuation = collateralValue(request, value);
    if (valuation != domain::RiskReason::Ok) {
      return reject(valuation, ratio);
    }
    max_borrow = saturatingMulDiv(value, kBpsDenominator, ratio);
  }

  // --- 5. Requested amount against the ceiling ------------------------------
  if (request.amount > max_borrow) {
    return reject(domain::RiskReason::Limit, ratio, max_borrow);
  }

  domain::RiskResult ok;
  ok.allowed = true;
  ok.collateral_ratio_bps = ratio;
  ok.max_borrow = max_borrow;
  ok.reason = domain::RiskReason::Ok;
  return ok;
}

void RiskPolicy::setReputationStore(
    std::shared_ptr<const IReputationStore> store) {
  reputation_ = std::move(store);
}

void RiskPolicy::setPriceFeed(std::shared_ptr<const IPriceFeed> feed) {
  price_feed_ = std::move(feed);
}

void RiskPolicy::setProofVerifier(
    std::shared_ptr<const IProofVerifier> verifier) {
  verifier_ = std::move(verifier);
}

}  // namespace credit
