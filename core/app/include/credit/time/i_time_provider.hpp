#pragma once

#include "credit/domain/types.hpp"

namespace credit {

// -----------------------------------------------------------------------------
// ITimeProvider: the ledger's only source of "now"
// -----------------------------------------------------------------------------
//
// @brief  Abstracts wall-clock time so loan deadlines and interest accrual
//         can be driven deterministically in tests and simulations.
//
// @details
// LoanLedger never calls std::chrono directly. Every timestamp it stores
// (start_ts, due_ts) and every accrual it computes comes from now_s().
//
// Implementations:
//   - LiveTimeProvider:       system clock, for the deployed daemon.
//   - SimulationTimeProvider: manually advanced, for tests and replays.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_s()
  // -------------------------------------------------------------------------
  // @brief  Current time in whole seconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual domain::Timestamp now_s() const = 0;
};

}  // namespace credit
