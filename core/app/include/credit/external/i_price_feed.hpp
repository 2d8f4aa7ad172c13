#pragma once

#include "credit/domain/types.hpp"

#include <cstdint>
#include <optional>

namespace credit {

// price / 10^decimals units of quote per unit of base.
struct PriceQuote {
  std::uint64_t price{0};
  std::uint32_t decimals{0};
};

// Base/quote price lookup. std::nullopt when the pair is unknown.
// Implementations may throw; RiskPolicy treats that as "no usable price".
class IPriceFeed {
 public:
  virtual ~IPriceFeed() = default;

  virtual std::optional<PriceQuote> getPrice(
      const domain::AssetId& base, const domain::AssetId& quote) const = 0;
};

}  // namespace credit
