#pragma once

#include "credit/domain/types.hpp"
#include "credit/external/i_asset_custody.hpp"

#include <vector>

namespace credit {

// -----------------------------------------------------------------------------
// TransferJournal: undo log for custody movements
// -----------------------------------------------------------------------------
//
// @brief  Makes a sequence of IAssetCustody transfers all-or-nothing.
//
// @details
// transfer() performs debit(from) then credit(to) immediately and records
// the movement. If credit() throws, the debit is reversed before the
// exception propagates, so a failed transfer leaves nothing behind.
//
// Unless commit() is called, the destructor replays the inverse of every
// recorded transfer in reverse order. LoanLedger creates one journal per
// operation and commits it only after its own state has been written, so
// an exception anywhere in between (custody, reputation hook) restores the
// custody balances the operation started from.
//
// A compensating transfer that itself fails is logged and skipped; the
// remaining entries are still reversed.
//
// Not copyable or movable: the journal is a scope guard.
// -----------------------------------------------------------------------------
class TransferJournal {
 public:
  explicit TransferJournal(IAssetCustody& custody) : custody_(custody) {}

  ~TransferJournal();

  TransferJournal(const TransferJournal&) = delete;
  TransferJournal& operator=(const TransferJournal&) = delete;
  TransferJournal(TransferJournal&&) = delete;
  TransferJournal& operator=(TransferJournal&&) = delete;

  // Moves amount of asset from `from` to `to`. Zero amounts are skipped.
  void transfer(const domain::AssetId& asset, const domain::Address& from,
                const domain::Address& to, domain::Amount amount);

  void commit() noexcept { committed_ = true; }

  // Reverses all recorded transfers now. Idempotent.
  void rollback() noexcept;

  std::size_t size() const { return entries_.size(); }

 private:
  struct Entry {
    domain::AssetId asset;
    domain::Address from;
    domain::Address to;
    domain::Amount amount;
  };

  IAssetCustody& custody_;
  std::vector<Entry> entries_;
  bool committed_{false};
};

}  // namespace credit
