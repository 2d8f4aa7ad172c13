#pragma once

#include "credit/domain/types.hpp"

#include <optional>
#include <string>

namespace credit {
namespace domain {

// Ephemeral input to LoanLedger::open() and RiskPolicy::assessBorrow().
// Never persisted.
struct BorrowRequest {
  AssetId asset;
  Amount amount{0};
  AssetId collateral_asset;
  Amount collateral_amount{0};
  std::uint64_t duration_s{0};
  std::optional<std::string> proof;  // identity proof, if the borrower has one
};

}  // namespace domain
}  // namespace credit
