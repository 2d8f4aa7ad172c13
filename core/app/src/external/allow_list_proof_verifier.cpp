#include "credit/external/allow_list_proof_verifier.hpp"

#include <utility>

namespace credit {

bool AllowListProofVerifier::verify(const domain::Address& borrower,
                                    const std::string& proof) const {
  auto it = tokens_.find(borrower);
  return it != tokens_.end() && !proof.empty() && it->second == proof;
}

void AllowListProofVerifier::registerProof(const domain::Address& borrower,
                                           std::string token) {
  tokens_[borrower] = std::move(token);
}

void AllowListProofVerifier::revoke(const domain::Address& borrower) {
  tokens_.erase(borrower);
}

}  // namespace credit
