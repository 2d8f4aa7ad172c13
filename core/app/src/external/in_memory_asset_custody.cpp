#include "credit/external/in_memory_asset_custody.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace credit {

void InMemoryAssetCustody::debit(const domain::AssetId& asset,
                                 const domain::Address& owner,
                                 domain::Amount amount) {
  auto it = balances_.find({asset, owner});
  domain::Amount held = (it == balances_.end()) ? 0 : it->second;
  if (held < amount) {
    throw std::runtime_error("insufficient " + asset + " balance for " +
                             owner + ": has " + std::to_string(held) +
                             ", needs " + std::to_string(amount));
  }
  if (amount == 0) {
    return;
  }
  it->second = held - amount;
}

void InMemoryAssetCustody::credit(const domain::AssetId& asset,
                                  const domain::Address& owner,
                                  domain::Amount amount) {
  domain::Amount& held = balances_[{asset, owner}];
  if (held > std::numeric_limits<domain::Amount>::max() - amount) {
    throw std::overflow_error("balance overflow for " + owner + " in " +
                              asset);
  }
  held += amount;
}

domain::Amount InMemoryAssetCustody::balanceOf(
    const domain::AssetId& asset, const domain::Address& owner) const {
  auto it = balances_.find({asset, owner});
  return (it == balances_.end()) ? 0 : it->second;
}

domain::Amount InMemoryAssetCustody::totalOf(
    const domain::AssetId& asset) const {
  domain::Amount total = 0;
  for (const auto& [key, amount] : balances_) {
    if (key.first == asset) {
      total += amount;
    }
  }
  return total;
}

}  // namespace credit
