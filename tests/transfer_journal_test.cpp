// =============================================================================
// transfer_journal_test.cpp
// =============================================================================
// Unit tests for credit::TransferJournal.
//
// Validates:
//   - Uncommitted journals undo every transfer on destruction
//   - Committed journals leave transfers in place
//   - Rollback runs in reverse order (later transfers may depend on earlier)
//   - A failed transfer leaves no partial movement behind
// =============================================================================

#include "credit/external/in_memory_asset_custody.hpp"
#include "credit/ledger/transfer_journal.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

class TransferJournalTest : public ::testing::Test {
 protected:
  void SetUp() override {
    custody.credit("USDC", "alice", 1000);
    custody.credit("USDC", "ledger", 5000);
  }

  credit::InMemoryAssetCustody custody;
};

// -----------------------------------------------------------------------------
// 1. Destruction without commit restores the starting balances.
// -----------------------------------------------------------------------------
TEST_F(TransferJournalTest, DestructorRollsBackUncommitted) {
  {
    credit::TransferJournal journal(custody);
    journal.transfer("USDC", "alice", "ledger", 400);
    journal.transfer("USDC", "ledger", "bob", 900);
    EXPECT_EQ(journal.size(), 2u);
    EXPECT_EQ(custody.balanceOf("USDC", "bob"), 900u);
  }
  EXPECT_EQ(custody.balanceOf("USDC", "alice"), 1000u);
  EXPECT_EQ(custody.balanceOf("USDC", "ledger"), 5000u);
  EXPECT_EQ(custody.balanceOf("USDC", "bob"), 0u);
}

// -----------------------------------------------------------------------------
// 2. Commit keeps the transfers.
// -----------------------------------------------------------------------------
TEST_F(TransferJournalTest, CommitKeepsTransfers) {
  {
    credit::TransferJournal journal(custody);
    journal.transfer("USDC", "alice", "ledger", 400);
    journal.commit();
  }
  EXPECT_EQ(custody.balanceOf("USDC", "alice"), 600u);
  EXPECT_EQ(custody.balanceOf("USDC", "ledger"), 5400u);
}

// -----------------------------------------------------------------------------
// 3. Reverse order: bob forwarded alice's 1000 to carol, so undoing
//    alice -> bob first would fail on bob's empty balance.
// -----------------------------------------------------------------------------
TEST_F(TransferJournalTest, RollbackRunsInReverseOrder) {
  credit::TransferJournal journal(custody);
  journal.transfer("USDC", "alice", "bob", 1000);
  journal.transfer("USDC", "bob", "carol", 1000);
  journal.rollback();

  EXPECT_EQ(custody.balanceOf("USDC", "alice"), 1000u);
  EXPECT_EQ(custody.balanceOf("USDC", "bob"), 0u);
  EXPECT_EQ(custody.balanceOf("USDC", "carol"), 0u);
  EXPECT_EQ(journal.size(), 0u);

  // Idempotent.
  journal.rollback();
  EXPECT_EQ(custody.balanceOf("USDC", "alice"), 1000u);
}

// -----------------------------------------------------------------------------
// 4. A failed debit records nothing and the exception propagates.
// -----------------------------------------------------------------------------
TEST_F(TransferJournalTest, FailedTransferLeavesNoTrace) {
  credit::TransferJournal journal(custody);
  journal.transfer("USDC", "alice", "ledger", 100);
  EXPECT_THROW(journal.transfer("USDC", "alice", "ledger", 10'000),
               std::runtime_error);
  EXPECT_EQ(journal.size(), 1u);
  EXPECT_EQ(custody.balanceOf("USDC", "alice"), 900u);
}

TEST_F(TransferJournalTest, ZeroAmountSkipped) {
  credit::TransferJournal journal(custody);
  journal.transfer("USDC", "nobody", "ledger", 0);
  EXPECT_EQ(journal.size(), 0u);
}
