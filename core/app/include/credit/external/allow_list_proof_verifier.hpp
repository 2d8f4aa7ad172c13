#pragma once

#include "credit/external/i_proof_verifier.hpp"

#include <unordered_map>

namespace credit {

// Accepts a proof iff it equals the token registered for the borrower.
class AllowListProofVerifier : public IProofVerifier {
 public:
  AllowListProofVerifier() = default;

  bool verify(const domain::Address& borrower,
              const std::string& proof) const override;

  void registerProof(const domain::Address& borrower, std::string token);

  void revoke(const domain::Address& borrower);

 private:
  std::unordered_map<domain::Address, std::string> tokens_;
};

}  // namespace credit
