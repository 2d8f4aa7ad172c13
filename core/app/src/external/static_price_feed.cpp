#include "credit/external/static_price_feed.hpp"

namespace credit {

std::optional<PriceQuote> StaticPriceFeed::getPrice(
    const domain::AssetId& base, const domain::AssetId& quote) const {
  auto it = prices_.find({base, quote});
  if (it == prices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void StaticPriceFeed::setPrice(const domain::AssetId& base,
                               const domain::AssetId& quote,
                               PriceQuote price) {
  prices_[{base, quote}] = price;
}

void StaticPriceFeed::clearPrice(const domain::AssetId& base,
                                 const domain::AssetId& quote) {
  prices_.erase({base, quote});
}

}  // namespace credit
