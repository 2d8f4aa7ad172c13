#include "credit/interest/interest_accrual_model.hpp"
#include "credit/math/mul_div.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace credit {

namespace {

constexpr std::uint64_t kYearBps = kSecondsPerYear * kBpsDenominator;

domain::Amount checkedAdd(domain::Amount a, domain::Amount b) {
  if (a > std::numeric_limits<domain::Amount>::max() - b) {
    throw std::overflow_error("interest accrual exceeds 64 bits");
  }
  return a + b;
}

}  // namespace

InterestAccrualModel::InterestAccrualModel(const config::InterestConfig& cfg)
    : InterestAccrualModel(cfg.apr_bps, cfg.penalty_apr_bps) {}

InterestAccrualModel::InterestAccrualModel(std::uint64_t apr_bps,
                                           std::uint64_t penalty_apr_bps)
    : apr_bps_(apr_bps), penalty_apr_bps_(penalty_apr_bps) {}

domain::Amount InterestAccrualModel::accrue(domain::Amount principal,
                                            std::uint64_t rate_bps,
                                            std::uint64_t elapsed_s) {
  if (principal == 0 || rate_bps == 0 || elapsed_s == 0) {
    return 0;
  }
  // rate_bps * elapsed_s can itself exceed 64 bits for absurd inputs
  // (rate > ~5.8e8 bps over a century), so keep it in 128 bits too.
  uint128_t rate_time;
  boost::multiprecision::multiply(rate_time, rate_bps, elapsed_s);
  if (rate_time > std::numeric_limits<std::uint64_t>::max()) {
    throw std::overflow_error("interest rate * time exceeds 64 bits");
  }
  return mul_div(principal, static_cast<std::uint64_t>(rate_time), kYearBps);
}

domain::Amount InterestAccrualModel::debt(domain::Amount principal,
                                          domain::Timestamp start_ts,
                                          domain::Timestamp now_ts) const {
  if (principal == 0 || now_ts <= start_ts) {
    return principal;
  }
  return checkedAdd(principal, accrue(principal, apr_bps_, now_ts - start_ts));
}

domain::Amount InterestAccrualModel::debtWithPenalty(
    domain::Amount principal, domain::Timestamp start_ts,
    domain::Timestamp due_ts, domain::Timestamp now_ts) const {
  if (principal == 0 || now_ts <= start_ts) {
    return principal;
  }

  const domain::Timestamp effective_due = std::max(due_ts, start_ts);
  if (now_ts <= effective_due) {
    return debt(principal, start_ts, now_ts);
  }

  domain::Amount normal =
      accrue(principal, apr_bps_, effective_due - start_ts);
  domain::Amount penalty =
      accrue(principal, penalty_apr_bps_, now_ts - effective_due);

  return checkedAdd(checkedAdd(principal, normal), penalty);
}

}  // namespace credit
