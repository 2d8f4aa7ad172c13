#pragma once

#include "credit/config/ledger_config.hpp"
#include "credit/interest/i_interest_model.hpp"

#include <cstdint>

namespace credit {

// -----------------------------------------------------------------------------
// InterestAccrualModel: simple (non-compounding) interest
// -----------------------------------------------------------------------------
//
// @brief  Pure function of time: owed = principal + principal * apr * dt / Y
//         with Y = kSecondsPerYear * 10000.
//
// @details
// Normal regime (now <= due):
//   owed = p + floor(p * apr_bps * (now - start) / Y)
//
// Penalty regime (now > due):
//   due' = max(due, start)
//   owed = p + floor(p * apr_bps         * (due' - start) / Y)
//            + floor(p * penalty_apr_bps * (now - due')   / Y)
//
// The two pieces are truncated separately, so a late loan can owe up to one
// unit less than a single combined division would give. Truncation always
// rounds in the borrower's favour.
//
// For principal == 0 or now <= start, owed == principal.
//
// Multiplication happens before division over a 128-bit intermediate
// (see mul_div.hpp); a result that does not fit in 64 bits throws
// std::overflow_error instead of wrapping.
//
// Thread-safety: immutable after construction; safe to share.
// -----------------------------------------------------------------------------
class InterestAccrualModel final : public IInterestModel {
 public:
  explicit InterestAccrualModel(const config::InterestConfig& cfg);

  InterestAccrualModel(std::uint64_t apr_bps, std::uint64_t penalty_apr_bps);

  domain::Amount debt(domain::Amount principal, domain::Timestamp start_ts,
                      domain::Timestamp now_ts) const override;

  domain::Amount debtWithPenalty(domain::Amount principal,
                                 domain::Timestamp start_ts,
                                 domain::Timestamp due_ts,
                                 domain::Timestamp now_ts) const override;

  std::uint64_t aprBps() const { return apr_bps_; }
  std::uint64_t penaltyAprBps() const { return penalty_apr_bps_; }

 private:
  // floor(principal * rate_bps * elapsed_s / Y)
  static domain::Amount accrue(domain::Amount principal,
                               std::uint64_t rate_bps,
                               std::uint64_t elapsed_s);

  const std::uint64_t apr_bps_;
  const std::uint64_t penalty_apr_bps_;
};

}  // namespace credit
