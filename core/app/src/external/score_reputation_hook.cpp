#include "credit/external/score_reputation_hook.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

namespace credit {

ScoreReputationHook::ScoreReputationHook(
    std::shared_ptr<IReputationStore> store,
    const config::ReputationConfig& cfg)
    : store_(std::move(store)), cfg_(cfg) {
  if (!store_) {
    throw std::invalid_argument("ScoreReputationHook requires a store");
  }
}

void ScoreReputationHook::requireKnown(domain::LoanId loan_id) const {
  if (cfg_.strict && open_loans_.count(loan_id) == 0) {
    throw HookRejected("reputation hook has no record of loan " +
                       std::to_string(loan_id));
  }
}

void ScoreReputationHook::onLoanOpened(domain::LoanId loan_id,
                                       const domain::Address& /*borrower*/) {
  open_loans_.insert(loan_id);
}

void ScoreReputationHook::onLoanAdopted(domain::LoanId loan_id,
                                        const domain::Address& /*borrower*/) {
  open_loans_.insert(loan_id);
}

void ScoreReputationHook::onLoanRepaid(domain::LoanId loan_id,
                                       const domain::Address& borrower,
                                       domain::Amount /*paid*/,
                                       domain::Amount /*total_repaid*/,
                                       domain::Amount /*total_debt*/,
                                       bool fully_repaid) {
  requireKnown(loan_id);
  if (!fully_repaid) {
    return;
  }

  domain::Score current = store_->scoreOf(borrower);
  domain::Score headroom = cfg_.max_score > current ? cfg_.max_score - current
                                                    : 0;
  domain::Score next = current + std::min(cfg_.score_step, headroom);
  store_->setScore(borrower, next);
  open_loans_.erase(loan_id);

  std::cout << "[ReputationHook] loan " << loan_id << " repaid: " << borrower
            << " score " << current << " -> " << next << "\n";
}

void ScoreReputationHook::onLoanDefaulted(domain::LoanId loan_id,
                                          const domain::Address& borrower) {
  requireKnown(loan_id);
  store_->mintBadge(borrower);
  open_loans_.erase(loan_id);

  std::cout << "[ReputationHook] loan " << loan_id << " defaulted: badge "
            << "minted for " << borrower << "\n";
}

}  // namespace credit
