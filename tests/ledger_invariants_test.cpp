// =============================================================================
// ledger_invariants_test.cpp
// =============================================================================
// Property test for credit::LoanLedger: a fixed-seed random sequence of
// open / repay / markDefault / time advances across several borrowers.
//
// After every step, whether it succeeded or was rejected:
//   - lockedCollateral(asset) == sum of collateral over Active loans
//   - lockedCollateral() == sum over assets
//   - every borrower has at most one Active loan and activeLoanOf agrees
//   - total supply of every asset in custody is unchanged
//   - loan ids are 1..nextLoanId()-1 with no gaps
// =============================================================================

#include "ledger_fixture.hpp"

#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using credit::domain::LoanStatus;
using credit_test::kDay;

class LedgerInvariantsTest : public credit_test::LedgerFixture {
 protected:
  void SetUp() override {
    for (const auto& who : borrowers) {
      custody->credit("USDC", who, 100'000);
      custody->credit("WETH", who, 20);
    }
    store->setScore("dave", 800);
    ledger->setFees("admin", 30, 1000, 500);
    ledger->setGracePeriod("admin", kDay);

    usdc_supply = custody->totalOf("USDC");
    weth_supply = custody->totalOf("WETH");
  }

  void checkInvariants(int step) {
    std::map<std::string, credit::domain::Amount> locked;
    std::map<std::string, int> active_per_borrower;
    credit::domain::Amount total = 0;

    auto all = ledger->snapshot();
    ASSERT_EQ(all.size(), ledger->nextLoanId() - 1) << "step " << step;
    for (std::size_t i = 0; i < all.size(); ++i) {
      ASSERT_EQ(all[i].id, i + 1) << "step " << step;
      if (all[i].status == LoanStatus::Active) {
        locked[all[i].collateral_asset] += all[i].collateral_amount;
        total += all[i].collateral_amount;
        ++active_per_borrower[all[i].borrower];
        EXPECT_EQ(ledger->activeLoanOf(all[i].borrower), all[i].id)
            << "step " << step;
      } else {
        EXPECT_NE(ledger->activeLoanOf(all[i].borrower), all[i].id)
            << "step " << step;
      }
    }

    EXPECT_EQ(ledger->lockedCollateral(), total) << "step " << step;
    EXPECT_EQ(ledger->lockedCollateral("USDC"), locked["USDC"])
        << "step " << step;
    EXPECT_EQ(ledger->lockedCollateral("WETH"), locked["WETH"])
        << "step " << step;
    for (const auto& [who, n] : active_per_borrower) {
      EXPECT_LE(n, 1) << who << " at step " << step;
    }

    EXPECT_EQ(custody->totalOf("USDC"), usdc_supply) << "step " << step;
    EXPECT_EQ(custody->totalOf("WETH"), weth_supply) << "step " << step;
  }

  const std::vector<std::string> borrowers{"alice", "bob", "carol", "dave"};
  credit::domain::Amount usdc_supply{0};
  credit::domain::Amount weth_supply{0};
};

TEST_F(LedgerInvariantsTest, RandomSequencePreservesInvariants) {
  std::mt19937 rng(20240601);
  std::uniform_int_distribution<int> pick_op(0, 3);
  std::uniform_int_distribution<std::size_t> pick_who(0, borrowers.size() - 1);
  std::uniform_int_distribution<credit::domain::Amount> pick_amount(1, 20'000);
  std::uniform_int_distribution<credit::domain::Amount> pick_collateral(0, 12);
  std::uniform_int_distribution<std::uint64_t> pick_days(0, 40);

  int opened = 0;
  int closed = 0;
  int rejected = 0;

  for (int step = 0; step < 500; ++step) {
    const std::string& who = borrowers[pick_who(rng)];
    const credit::domain::LoanId active = ledger->activeLoanOf(who);

    try {
      switch (pick_op(rng)) {
        case 0: {
          const bool same_asset = (step % 3 == 0);
          const auto amount = pick_amount(rng);
          const auto collateral = same_asset ? amount * 3 / 2 + pick_collateral(rng)
                                             : pick_collateral(rng);
          ledger->open(who, request(amount, same_asset ? "USDC" : "WETH",
                                    collateral, (1 + pick_days(rng)) * kDay));
          ++opened;
          break;
        }
        case 1:
          if (active != credit::domain::kNoLoan) {
            if (ledger->repay(who, active, pick_amount(rng)).fully_repaid) {
              ++closed;
            }
          }
          break;
        case 2:
          if (active != credit::domain::kNoLoan) {
            ledger->markDefault("keeper", active);
            ++closed;
          }
          break;
        default:
          clock.advance_time(pick_days(rng) * kDay / 4);
          break;
      }
    } catch (const credit::LedgerError&) {
      ++rejected;
    } catch (const std::runtime_error&) {
      // Payer short of funds.
      ++rejected;
    }

    checkInvariants(step);
    if (::testing::Test::HasFatalFailure()) {
      return;
    }
  }

  // The sequence must actually exercise the ledger.
  EXPECT_GT(opened, 10);
  EXPECT_GT(closed, 5);
  EXPECT_GT(rejected, 0);
}
