#pragma once

#include "credit/domain/types.hpp"

namespace credit {

// -----------------------------------------------------------------------------
// IAssetCustody: fungible asset balances
// -----------------------------------------------------------------------------
//
// @brief  The ledger moves value only through this interface.
//
// @details
// A transfer from A to B is debit(asset, A, x) followed by
// credit(asset, B, x). Assets must be fee-less and non-rebasing: the ledger
// assumes a credit of x raises balanceOf by exactly x. Collateral accounting
// is wrong for any asset that violates this.
//
// debit() must throw if owner holds less than amount. Any exception thrown
// by either call aborts the ledger operation that issued it.
// -----------------------------------------------------------------------------
class IAssetCustody {
 public:
  virtual ~IAssetCustody() = default;

  virtual void debit(const domain::AssetId& asset,
                     const domain::Address& owner, domain::Amount amount) = 0;

  virtual void credit(const domain::AssetId& asset,
                      const domain::Address& owner, domain::Amount amount) = 0;

  virtual domain::Amount balanceOf(const domain::AssetId& asset,
                                   const domain::Address& owner) const = 0;
};

}  // namespace credit
