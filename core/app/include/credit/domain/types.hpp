#pragma once

#include <cstdint>
#include <string>

namespace credit {
namespace domain {

// Account identifier. The empty string is the null address.
using Address = std::string;

// Fungible asset identifier (e.g. "USDC"). The empty string is the null asset.
using AssetId = std::string;

// Token amounts in the asset's smallest unit.
using Amount = std::uint64_t;

// Seconds since the Unix epoch.
using Timestamp = std::uint64_t;

// Loan ids start at 1; 0 means "no loan".
using LoanId = std::uint64_t;

using Score = std::uint64_t;

inline constexpr LoanId kNoLoan = 0;

}  // namespace domain
}  // namespace credit
