#pragma once

#include "credit/events/ledger_events.hpp"

#include <variant>

namespace credit {

// Closed set of everything the EventBus can carry.
using Event = std::variant<
    LoanOpenedEvent,
    LoanRepaidEvent,
    LoanDefaultedEvent,
    LedgerPausedEvent>;

}  // namespace credit
