#pragma once

#include "credit/time/i_time_provider.hpp"

#include <atomic>

namespace credit {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: manually driven clock
// -----------------------------------------------------------------------------
//
// @brief  Returns whatever time was last set. Starts at the value given to
//         the constructor (0 by default).
//
// @details
// Used by the test suite to step across due dates and grace periods one
// second at a time, and by LedgerService's ADVANCE_TIME command.
//
// Monotonicity is not enforced by set_time(); advance_time() can only move
// forward because its argument is unsigned.
//
// Thread-safety: all members are atomic.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(domain::Timestamp start_s = 0)
      : current_time_s_(start_s) {}

  domain::Timestamp now_s() const override;

  // Moves the clock forward by delta_s seconds and returns the new time.
  domain::Timestamp advance_time(domain::Timestamp delta_s);

  void set_time(domain::Timestamp new_time_s);

 private:
  std::atomic<domain::Timestamp> current_time_s_;
};

}  // namespace credit
