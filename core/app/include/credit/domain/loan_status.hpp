#pragma once

namespace credit {
namespace domain {

// -----------------------------------------------------------------------------
// LoanStatus: lifecycle state of a loan slot
// -----------------------------------------------------------------------------
//
// @brief  Legal transitions: None -> Active -> {Repaid, Defaulted}.
//
// @details
// None is the state of a slot that was never written. Repaid and Defaulted
// are terminal; the slot keeps its last values forever and the loan id is
// never handed out again.
//
// Liquidated is reserved for collateral seizure and is never produced by
// the current ledger.
// -----------------------------------------------------------------------------
enum class LoanStatus {
  None,
  Active,
  Repaid,
  Defaulted,
  Liquidated,
};

const char* toString(LoanStatus status);

}  // namespace domain
}  // namespace credit
