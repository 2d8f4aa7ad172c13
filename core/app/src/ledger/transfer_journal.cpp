#include "credit/ledger/transfer_journal.hpp"

#include <exception>
#include <iostream>

namespace credit {

TransferJournal::~TransferJournal() {
  if (!committed_) {
    rollback();
  }
}

void TransferJournal::transfer(const domain::AssetId& asset,
                               const domain::Address& from,
                               const domain::Address& to,
                               domain::Amount amount) {
  if (amount == 0) {
    return;
  }

  custody_.debit(asset, from, amount);
  try {
    custody_.credit(asset, to, amount);
  } catch (...) {
    custody_.credit(asset, from, amount);
    throw;
  }

  entries_.push_back(Entry{asset, from, to, amount});
}

void TransferJournal::rollback() noexcept {
  if (!entries_.empty()) {
    std::cerr << "[TransferJournal] rolling back " << entries_.size()
              << " transfer(s)\n";
  }

  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    try {
      custody_.debit(it->asset, it->to, it->amount);
      custody_.credit(it->asset, it->from, it->amount);
    } catch (const std::exception& e) {
      std::cerr << "[TransferJournal] CRITICAL: could not reverse "
                << it->amount << " " << it->asset << " " << it->from
                << " -> " << it->to << ": " << e.what() << "\n";
    }
  }
  entries_.clear();
  committed_ = true;
}

}  // namespace credit
