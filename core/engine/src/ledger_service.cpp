#include "credit/engine/ledger_service.hpp"
#include "credit/errors/ledger_error.hpp"
#include "credit/time/live_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace credit {

namespace {

domain::BorrowRequest parseBorrowRequest(const nlohmann::json& j) {
  domain::BorrowRequest req;
  req.asset = j.at("asset").get<std::string>();
  req.amount = j.at("amount").get<domain::Amount>();
  req.collateral_asset = j.value("collateral_asset", std::string{});
  req.collateral_amount = j.value("collateral_amount", domain::Amount{0});
  req.duration_s = j.at("duration_s").get<std::uint64_t>();
  if (j.contains("proof")) {
    req.proof = j.at("proof").get<std::string>();
  }
  return req;
}

nlohmann::json loanToJson(const domain::Loan& l) {
  nlohmann::json j;
  j["loan_id"] = l.id;
  j["borrower"] = l.borrower;
  j["asset"] = l.asset;
  j["collateral_asset"] = l.collateral_asset;
  j["principal"] = l.principal;
  j["principal_repaid"] = l.principal_repaid;
  j["collateral_amount"] = l.collateral_amount;
  j["start_ts"] = l.start_ts;
  j["due_ts"] = l.due_ts;
  j["status"] = domain::toString(l.status);
  return j;
}

nlohmann::json riskToJson(const domain::RiskResult& r) {
  nlohmann::json j;
  j["allowed"] = r.allowed;
  j["collateral_ratio_bps"] = r.collateral_ratio_bps;
  j["max_borrow"] = r.max_borrow;
  j["reason"] = domain::toString(r.reason);
  return j;
}

nlohmann::json errorReply(const std::string& kind, const std::string& code,
                          const std::string& message) {
  nlohmann::json j;
  j["status"] = "error";
  j["kind"] = kind;
  j["code"] = code;
  j["message"] = message;
  return j;
}

void requireAdmin(const nlohmann::json& req, const config::AppConfig& cfg) {
  if (req.value("caller", std::string{}) != cfg.ledger.admin) {
    throw LedgerError(ErrorKind::Unauthorized, ErrorCode::NotAdmin,
                      "command requires the ledger admin");
  }
}

}  // namespace

LedgerService::LedgerService(const config::AppConfig& cfg) : cfg_(cfg) {
  config::validate(cfg_);

  if (cfg_.sim_start_s != 0) {
    auto sim = std::make_unique<SimulationTimeProvider>(cfg_.sim_start_s);
    sim_clock_ = sim.get();
    clock_ = std::move(sim);
  } else {
    clock_ = std::make_unique<LiveTimeProvider>();
  }

  custody_ = std::make_shared<InMemoryAssetCustody>();
  reputation_ =
      std::make_shared<InMemoryReputationStore>(cfg_.reputation.max_score);
  price_feed_ = std::make_shared<StaticPriceFeed>();
  verifier_ = std::make_shared<AllowListProofVerifier>();
  hook_ = std::make_shared<ScoreReputationHook>(reputation_, cfg_.reputation);
  risk_policy_ = std::make_shared<RiskPolicy>(cfg_.risk, reputation_,
                                              price_feed_, verifier_);
  interest_model_ = std::make_shared<InterestAccrualModel>(cfg_.interest);

  ledger_ = std::make_unique<LoanLedger>(cfg_.ledger, *clock_, bus_, custody_,
                                         risk_policy_, interest_model_, hook_);
}

LedgerService::~LedgerService() { stop(); }

void LedgerService::start() {
  if (running_) {
    return;
  }

  if (!cfg_.ipc_cmd_endpoint.empty() && !cfg_.ipc_pub_endpoint.empty()) {
    auto server = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        cfg_.ipc_cmd_endpoint, cfg_.ipc_pub_endpoint);
    server->start();
    ipc_server_ = std::move(server);

    telemetry_sub_id_ = bus_.subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  running_ = true;
  std::cout << "[LedgerService] started ("
            << (sim_clock_ ? "simulation clock" : "wall clock") << ", "
            << (ipc_server_ ? "IPC on" : "IPC off") << ").\n";
}

void LedgerService::stop() {
  if (!running_) {
    return;
  }

  if (ipc_server_) {
    ipc_server_->stop();
    bus_.unsubscribe(telemetry_sub_id_);
    ipc_server_.reset();
  }

  running_ = false;
  std::cout << "[LedgerService] stopped.\n";
}

std::string LedgerService::executeCommand(const std::string& request) {
  std::lock_guard lock(command_mutex_);
  nlohmann::json response;

  try {
    auto req = nlohmann::json::parse(request);
    const std::string cmd = req.at("cmd").get<std::string>();

    if (cmd == "PING") {
      response["response"] = "PONG";

    } else if (cmd == "STATUS") {
      response["paused"] = ledger_->isPaused();
      response["next_loan_id"] = ledger_->nextLoanId();
      response["locked_collateral"] = ledger_->lockedCollateral();
      response["now_s"] = clock_->now_s();
      nlohmann::json loans = nlohmann::json::array();
      for (const auto& l : ledger_->snapshot()) {
        loans.push_back(loanToJson(l));
      }
      response["loans"] = std::move(loans);

    } else if (cmd == "DEPOSIT") {
      requireAdmin(req, cfg_);
      custody_->credit(req.at("asset").get<std::string>(),
                       req.at("owner").get<std::string>(),
                       req.at("amount").get<domain::Amount>());

    } else if (cmd == "BALANCE") {
      response["balance"] =
          custody_->balanceOf(req.at("asset").get<std::string>(),
                              req.at("owner").get<std::string>());

    } else if (cmd == "SET_PRICE") {
      requireAdmin(req, cfg_);
      PriceQuote quote;
      quote.price = req.at("price").get<std::uint64_t>();
      quote.decimals = req.value("decimals", std::uint32_t{0});
      price_feed_->setPrice(req.at("base").get<std::string>(),
                            req.at("quote").get<std::string>(), quote);

    } else if (cmd == "SET_SCORE") {
      requireAdmin(req, cfg_);
      reputation_->setScore(req.at("address").get<std::string>(),
                            req.at("score").get<domain::Score>());

    } else if (cmd == "REGISTER_PROOF") {
      requireAdmin(req, cfg_);
      verifier_->registerProof(req.at("borrower").get<std::string>(),
                               req.at("token").get<std::string>());

    } else if (cmd == "ASSESS") {
      response["risk"] = riskToJson(risk_policy_->assessBorrow(
          req.at("borrower").get<std::string>(), parseBorrowRequest(req)));

    } else if (cmd == "OPEN") {
      response["loan_id"] = ledger_->open(
          req.at("borrower").get<std::string>(), parseBorrowRequest(req));

    } else if (cmd == "REPAY") {
      auto result = ledger_->repay(req.at("payer").get<std::string>(),
                                   req.at("loan_id").get<domain::LoanId>(),
                                   req.at("amount").get<domain::Amount>());
      response["paid_net"] = result.paid_net;
      response["total_repaid"] = result.total_repaid;
      response["total_debt"] = result.total_debt;
      response["fully_repaid"] = result.fully_repaid;

    } else if (cmd == "DEFAULT") {
      response["bounty"] =
          ledger_->markDefault(req.at("keeper").get<std::string>(),
                               req.at("loan_id").get<domain::LoanId>());

    } else if (cmd == "LOAN") {
      auto l = ledger_->loan(req.at("loan_id").get<domain::LoanId>());
      if (!l) {
        throw LedgerError(ErrorKind::StateConflict, ErrorCode::LoanNotFound,
                          "no such loan");
      }
      response["loan"] = loanToJson(*l);

    } else if (cmd == "DEBT") {
      response["debt"] =
          ledger_->getDebt(req.at("loan_id").get<domain::LoanId>());

    } else if (cmd == "SET_FEES") {
      ledger_->setFees(req.value("caller", std::string{}),
                       req.at("origination_fee_bps").get<std::uint64_t>(),
                       req.at("protocol_fee_bps").get<std::uint64_t>(),
                       req.at("default_bounty_bps").get<std::uint64_t>());

    } else if (cmd == "PAUSE") {
      ledger_->pause(req.value("caller", std::string{}));

    } else if (cmd == "UNPAUSE") {
      ledger_->unpause(req.value("caller", std::string{}));

    } else if (cmd == "ADVANCE_TIME") {
      if (sim_clock_ == nullptr) {
        return errorReply("InvalidInput", "NotSimulated",
                          "ADVANCE_TIME requires the simulation clock")
            .dump();
      }
      response["now_s"] =
          sim_clock_->advance_time(req.at("seconds").get<std::uint64_t>());

    } else {
      return errorReply("InvalidInput", "UnknownCommand",
                        "Unknown command: " + cmd)
          .dump();
    }

    response["status"] = "ok";

  } catch (const LedgerError& e) {
    auto reply = errorReply(toString(e.kind()), toString(e.code()), e.what());
    if (e.risk()) {
      reply["risk"] = riskToJson(*e.risk());
    }
    return reply.dump();

  } catch (const nlohmann::json::exception& e) {
    return errorReply("InvalidInput", "BadRequest", e.what()).dump();

  } catch (const std::exception& e) {
    // Collaborator failures (e.g. insufficient balance in custody). The
    // ledger has already rolled back; report and keep serving.
    std::cerr << "[LedgerService] command failed: " << e.what() << "\n";
    return errorReply("DependencyFailure", "CollaboratorError", e.what())
        .dump();
  }

  return response.dump();
}

}  // namespace credit
