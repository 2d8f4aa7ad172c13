#pragma once

#include "credit/domain/risk_result.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace credit {

// -----------------------------------------------------------------------------
// ErrorKind: coarse category a caller branches on
// -----------------------------------------------------------------------------
//
// PolicyRejection and ResourceExhaustion are ordinary business outcomes: the
// caller may retry with different input or later. ReentrancyViolation and
// DependencyUnavailable mean the ledger was misused or misconfigured.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  InvalidInput,
  StateConflict,
  PolicyRejection,
  ResourceExhaustion,
  ReentrancyViolation,
  DependencyUnavailable,
  Unauthorized,
};

enum class ErrorCode {
  ZeroAmount,
  ZeroAddress,
  DurationOutOfBounds,
  InvalidConfig,
  Paused,
  LoanAlreadyActive,
  LoanNotFound,
  LoanNotActive,
  NotBorrower,
  NotPastDue,
  BorrowNotAllowed,
  InsufficientLiquidity,
  Reentrancy,
  ModuleNotConfigured,
  NotAdmin,
};

const char* toString(ErrorKind kind);
const char* toString(ErrorCode code);

// -----------------------------------------------------------------------------
// LedgerError
// -----------------------------------------------------------------------------
//
// @brief  The one exception type the ledger raises for precondition and
//         policy failures.
//
// @details
// By the time a LedgerError leaves a LoanLedger entry point, every piece of
// ledger state is exactly as it was before the call. Errors thrown by
// collaborators (custody, reputation hook) are not wrapped; they propagate
// unchanged after the ledger has rolled back.
//
// For ErrorCode::BorrowNotAllowed, risk() holds the RiskResult that caused
// the rejection, so callers can read reason() and max_borrow.
// -----------------------------------------------------------------------------
class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorKind kind, ErrorCode code, const std::string& detail);

  LedgerError(const domain::RiskResult& risk, const std::string& detail);

  ErrorKind kind() const noexcept { return kind_; }
  ErrorCode code() const noexcept { return code_; }
  const std::optional<domain::RiskResult>& risk() const noexcept {
    return risk_;
  }

 private:
  ErrorKind kind_;
  ErrorCode code_;
  std::optional<domain::RiskResult> risk_;
};

}  // namespace credit
