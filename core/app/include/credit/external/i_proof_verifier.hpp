#pragma once

#include "credit/domain/types.hpp"

#include <string>

namespace credit {

// Identity proof check consulted by RiskPolicy when proofs are required.
// Implementations may throw; RiskPolicy treats that as an invalid proof.
class IProofVerifier {
 public:
  virtual ~IProofVerifier() = default;

  virtual bool verify(const domain::Address& borrower,
                      const std::string& proof) const = 0;
};

}  // namespace credit
