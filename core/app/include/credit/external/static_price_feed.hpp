#pragma once

#include "credit/external/i_price_feed.hpp"

#include <map>
#include <utility>

namespace credit {

// IPriceFeed serving prices set with setPrice(). Lookups are directional:
// a price for (WETH, USDC) says nothing about (USDC, WETH).
class StaticPriceFeed : public IPriceFeed {
 public:
  StaticPriceFeed() = default;

  std::optional<PriceQuote> getPrice(
      const domain::AssetId& base,
      const domain::AssetId& quote) const override;

  void setPrice(const domain::AssetId& base, const domain::AssetId& quote,
                PriceQuote price);

  void clearPrice(const domain::AssetId& base, const domain::AssetId& quote);

 private:
  std::map<std::pair<domain::AssetId, domain::AssetId>, PriceQuote> prices_;
};

}  // namespace credit
