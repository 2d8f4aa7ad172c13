#include "credit/errors/ledger_error.hpp"

namespace credit {

namespace {

std::string formatMessage(ErrorKind kind, ErrorCode code,
                          const std::string& detail) {
  std::string msg = toString(kind);
  msg += "(";
  msg += toString(code);
  msg += ")";
  if (!detail.empty()) {
    msg += ": ";
    msg += detail;
  }
  return msg;
}

}  // namespace

LedgerError::LedgerError(ErrorKind kind, ErrorCode code,
                         const std::string& detail)
    : std::runtime_error(formatMessage(kind, code, detail)),
      kind_(kind),
      code_(code) {}

LedgerError::LedgerError(const domain::RiskResult& risk,
                         const std::string& detail)
    : std::runtime_error(formatMessage(
          ErrorKind::PolicyRejection, ErrorCode::BorrowNotAllowed,
          detail + " [" + domain::toString(risk.reason) + "]")),
      kind_(ErrorKind::PolicyRejection),
      code_(ErrorCode::BorrowNotAllowed),
      risk_(risk) {}

const char* toString(ErrorKind kind) {
  using K = ErrorKind;
  switch (kind) {
    case K::InvalidInput:          return "InvalidInput";
    case K::StateConflict:         return "StateConflict";
    case K::PolicyRejection:       return "PolicyRejection";
    case K::ResourceExhaustion:    return "ResourceExhaustion";
    case K::ReentrancyViolation:   return "ReentrancyViolation";
    case K::DependencyUnavailable: return "DependencyUnavailable";
    case K::Unauthorized:          return "Unauthorized";
  }
  return "Unknown";
}

const char* toString(ErrorCode code) {
  using C = ErrorCode;
  switch (code) {
    case C::ZeroAmount:            return "ZeroAmount";
    case C::ZeroAddress:           return "ZeroAddress";
    case C::DurationOutOfBounds:   return "DurationOutOfBounds";
    case C::InvalidConfig:         return "InvalidConfig";
    case C::Paused:                return "Paused";
    case C::LoanAlreadyActive:     return "LoanAlreadyActive";
    case C::LoanNotFound:          return "LoanNotFound";
    case C::LoanNotActive:         return "LoanNotActive";
    case C::NotBorrower:           return "NotBorrower";
    case C::NotPastDue:            return "NotPastDue";
    case C::BorrowNotAllowed:      return "BorrowNotAllowed";
    case C::InsufficientLiquidity: return "InsufficientLiquidity";
    case C::Reentrancy:            return "Reentrancy";
    case C::ModuleNotConfigured:   return "ModuleNotConfigured";
    case C::NotAdmin:              return "NotAdmin";
  }
  return "Unknown";
}

}  // namespace credit
