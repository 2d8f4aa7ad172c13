#pragma once

#include "credit/external/i_asset_custody.hpp"

#include <map>
#include <utility>

namespace credit {

// Map-backed IAssetCustody used by LedgerService and the test suite.
// Not thread-safe; LedgerService serialises access.
class InMemoryAssetCustody : public IAssetCustody {
 public:
  InMemoryAssetCustody() = default;

  void debit(const domain::AssetId& asset, const domain::Address& owner,
             domain::Amount amount) override;

  void credit(const domain::AssetId& asset, const domain::Address& owner,
              domain::Amount amount) override;

  domain::Amount balanceOf(const domain::AssetId& asset,
                           const domain::Address& owner) const override;

  // Total supply of an asset across all owners.
  domain::Amount totalOf(const domain::AssetId& asset) const;

 private:
  std::map<std::pair<domain::AssetId, domain::Address>, domain::Amount>
      balances_;
};

}  // namespace credit
