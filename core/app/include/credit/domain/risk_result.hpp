#pragma once

#include "credit/domain/types.hpp"

#include <cstdint>

namespace credit {
namespace domain {

// Why an admission check failed. Ok when it did not.
enum class RiskReason {
  Ok,
  Defaulter,
  MissingProof,
  BadProof,
  NoOracle,
  NoCollateral,
  UnsupportedCollateral,
  BadPrice,
  Limit,
};

const char* toString(RiskReason reason);

// -----------------------------------------------------------------------------
// RiskResult: outcome of RiskPolicy::assessBorrow()
// -----------------------------------------------------------------------------
//
// @details
// max_borrow is meaningful even when allowed is false with reason Limit:
// it is the ceiling the caller may retry with. For every other rejection
// it is 0.
// -----------------------------------------------------------------------------
struct RiskResult {
  bool allowed{false};
  std::uint64_t collateral_ratio_bps{0};
  Amount max_borrow{0};
  RiskReason reason{RiskReason::Ok};

  bool operator==(const RiskResult& other) const {
    return allowed == other.allowed &&
           collateral_ratio_bps == other.collateral_ratio_bps &&
           max_borrow == other.max_borrow && reason == other.reason;
  }
  bool operator!=(const RiskResult& other) const { return !(*this == other); }
};

}  // namespace domain
}  // namespace credit
