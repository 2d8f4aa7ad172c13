#include "credit/domain/loan_status.hpp"
#include "credit/domain/risk_result.hpp"

namespace credit {
namespace domain {

const char* toString(LoanStatus status) {
  using S = LoanStatus;
  switch (status) {
    case S::None:       return "None";
    case S::Active:     return "Active";
    case S::Repaid:     return "Repaid";
    case S::Defaulted:  return "Defaulted";
    case S::Liquidated: return "Liquidated";
  }
  return "Unknown";
}

const char* toString(RiskReason reason) {
  using R = RiskReason;
  switch (reason) {
    case R::Ok:                    return "OK";
    case R::Defaulter:             return "DEFAULTER";
    case R::MissingProof:          return "MISSING_PROOF";
    case R::BadProof:              return "BAD_PROOF";
    case R::NoOracle:              return "NO_ORACLE";
    case R::NoCollateral:          return "NO_COLLATERAL";
    case R::UnsupportedCollateral: return "UNSUPPORTED_COLLATERAL";
    case R::BadPrice:              return "BAD_PRICE";
    case R::Limit:                 return "LIMIT";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace credit
