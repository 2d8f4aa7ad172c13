// =============================================================================
// ledger_service_test.cpp
// =============================================================================
// End-to-end tests for credit::LedgerService through its JSON command
// interface, plus the telemetry rendering used by the IPC server.
//
// The service runs on the simulation clock with IPC disabled (empty
// endpoints), so no sockets are bound.
//
// Validates:
//   - PING / STATUS / BALANCE / DEPOSIT basics
//   - Full loan flow: OPEN -> ADVANCE_TIME -> DEBT -> REPAY
//   - Default flow and reputation effects
//   - Error replies carry kind, code and the risk result where relevant
//   - Malformed and unknown commands never throw
// =============================================================================

#include "credit/engine/ledger_service.hpp"
#include "credit/network/ipc_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

using nlohmann::json;

namespace {

constexpr std::uint64_t kDay = 86400;

credit::config::AppConfig testConfig() {
  credit::config::AppConfig cfg;
  cfg.ipc_cmd_endpoint.clear();
  cfg.ipc_pub_endpoint.clear();
  cfg.sim_start_s = 1'000'000;
  cfg.ledger.protocol_fee_bps = 1000;
  cfg.ledger.default_bounty_bps = 500;
  return cfg;
}

}  // namespace

class LedgerServiceTest : public ::testing::Test {
 protected:
  LedgerServiceTest() : service(testConfig()) {
    service.start();
    send({{"cmd", "DEPOSIT"}, {"caller", "admin"}, {"asset", "USDC"},
          {"owner", "ledger"}, {"amount", 10'000'000}});
    send({{"cmd", "DEPOSIT"}, {"caller", "admin"}, {"asset", "USDC"},
          {"owner", "alice"}, {"amount", 2'000'000}});
  }

  json send(const json& request) {
    return json::parse(service.executeCommand(request.dump()));
  }

  json openAlice(std::uint64_t amount, std::uint64_t collateral) {
    return send({{"cmd", "OPEN"},
                 {"borrower", "alice"},
                 {"asset", "USDC"},
                 {"amount", amount},
                 {"collateral_asset", "USDC"},
                 {"collateral_amount", collateral},
                 {"duration_s", 30 * kDay}});
  }

  credit::LedgerService service;
};

TEST_F(LedgerServiceTest, PingAndStatus) {
  EXPECT_EQ(send({{"cmd", "PING"}})["response"], "PONG");

  auto status = send({{"cmd", "STATUS"}});
  EXPECT_EQ(status["status"], "ok");
  EXPECT_EQ(status["paused"], false);
  EXPECT_EQ(status["next_loan_id"], 1);
  EXPECT_EQ(status["now_s"], 1'000'000);
  EXPECT_TRUE(status["loans"].empty());
}

TEST_F(LedgerServiceTest, DepositRequiresAdmin) {
  auto reply = send({{"cmd", "DEPOSIT"}, {"caller", "alice"},
                     {"asset", "USDC"}, {"owner", "alice"}, {"amount", 1}});
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["kind"], "Unauthorized");
  EXPECT_EQ(reply["code"], "NotAdmin");

  auto bal = send({{"cmd", "BALANCE"}, {"asset", "USDC"}, {"owner", "alice"}});
  EXPECT_EQ(bal["balance"], 2'000'000);
}

// -----------------------------------------------------------------------------
// Open, wait ten days, repay in full with an overpayment.
// -----------------------------------------------------------------------------
TEST_F(LedgerServiceTest, OpenAccrueAndRepay) {
  auto opened = openAlice(1'000'000, 1'500'000);
  ASSERT_EQ(opened["status"], "ok") << opened.dump();
  const auto id = opened["loan_id"].get<std::uint64_t>();
  EXPECT_EQ(id, 1u);

  auto now = send({{"cmd", "ADVANCE_TIME"}, {"seconds", 10 * kDay}});
  EXPECT_EQ(now["now_s"], 1'000'000 + 10 * kDay);

  EXPECT_EQ(send({{"cmd", "DEBT"}, {"loan_id", id}})["debt"], 1'002'739);

  auto repaid = send({{"cmd", "REPAY"}, {"payer", "alice"}, {"loan_id", id},
                      {"amount", 1'100'000}});
  ASSERT_EQ(repaid["status"], "ok") << repaid.dump();
  EXPECT_EQ(repaid["fully_repaid"], true);
  EXPECT_EQ(repaid["paid_net"], 1'002'739);

  auto loan = send({{"cmd", "LOAN"}, {"loan_id", id}});
  EXPECT_EQ(loan["loan"]["status"], "Repaid");
  EXPECT_EQ(send({{"cmd", "BALANCE"}, {"asset", "USDC"},
                  {"owner", "treasury"}})["balance"],
            273);
  EXPECT_EQ(service.reputation().scoreOf("alice"), 50u);
}

// -----------------------------------------------------------------------------
// A rejected borrow reports the policy decision alongside the error.
// -----------------------------------------------------------------------------
TEST_F(LedgerServiceTest, RejectedOpenCarriesRisk) {
  auto reply = openAlice(1001, 1500);
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["kind"], "PolicyRejection");
  EXPECT_EQ(reply["code"], "BorrowNotAllowed");
  EXPECT_EQ(reply["risk"]["reason"], "LIMIT");
  EXPECT_EQ(reply["risk"]["max_borrow"], 1000);

  auto assess = send({{"cmd", "ASSESS"}, {"borrower", "alice"},
                      {"asset", "USDC"}, {"amount", 1000},
                      {"collateral_asset", "USDC"},
                      {"collateral_amount", 1500}, {"duration_s", kDay}});
  EXPECT_EQ(assess["risk"]["allowed"], true);
  EXPECT_EQ(assess["risk"]["collateral_ratio_bps"], 15000);
}

TEST_F(LedgerServiceTest, DefaultFlow) {
  const auto id = openAlice(1000, 1500)["loan_id"].get<std::uint64_t>();

  auto early = send({{"cmd", "DEFAULT"}, {"keeper", "bob"}, {"loan_id", id}});
  EXPECT_EQ(early["code"], "NotPastDue");

  send({{"cmd", "ADVANCE_TIME"}, {"seconds", 30 * kDay + 1}});
  auto reply = send({{"cmd", "DEFAULT"}, {"keeper", "bob"}, {"loan_id", id}});
  ASSERT_EQ(reply["status"], "ok") << reply.dump();
  EXPECT_EQ(reply["bounty"], 75);
  EXPECT_TRUE(service.reputation().hasBadge("alice"));

  auto again = openAlice(10, 1500);
  EXPECT_EQ(again["risk"]["reason"], "DEFAULTER");
}

TEST_F(LedgerServiceTest, PauseAndUnpause) {
  EXPECT_EQ(send({{"cmd", "PAUSE"}, {"caller", "mallory"}})["code"],
            "NotAdmin");
  EXPECT_EQ(send({{"cmd", "PAUSE"}, {"caller", "admin"}})["status"], "ok");

  auto blocked = openAlice(1000, 1500);
  EXPECT_EQ(blocked["kind"], "StateConflict");
  EXPECT_EQ(blocked["code"], "Paused");

  EXPECT_EQ(send({{"cmd", "UNPAUSE"}, {"caller", "admin"}})["status"], "ok");
  EXPECT_EQ(openAlice(1000, 1500)["status"], "ok");
}

// -----------------------------------------------------------------------------
// A custody failure (payer short of funds) is reported, not thrown.
// -----------------------------------------------------------------------------
TEST_F(LedgerServiceTest, CollaboratorFailureReported) {
  const auto id = openAlice(1000, 1500)["loan_id"].get<std::uint64_t>();
  auto reply = send({{"cmd", "REPAY"}, {"payer", "alice"}, {"loan_id", id},
                     {"amount", 50'000'000}});
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["kind"], "DependencyFailure");
  EXPECT_EQ(reply["code"], "CollaboratorError");
}

TEST_F(LedgerServiceTest, MalformedAndUnknownCommands) {
  auto not_json = json::parse(service.executeCommand("{oops"));
  EXPECT_EQ(not_json["code"], "BadRequest");

  EXPECT_EQ(send({{"nocmd", 1}})["code"], "BadRequest");
  EXPECT_EQ(send({{"cmd", "OPEN"}, {"borrower", "alice"}})["code"],
            "BadRequest");
  EXPECT_EQ(send({{"cmd", "FLY"}})["code"], "UnknownCommand");
  EXPECT_EQ(send({{"cmd", "LOAN"}, {"loan_id", 77}})["code"], "LoanNotFound");
}

TEST(LedgerServiceClockTest, AdvanceTimeNeedsSimulationClock) {
  auto cfg = testConfig();
  cfg.sim_start_s = 0;
  credit::LedgerService service(cfg);
  EXPECT_EQ(service.simClock(), nullptr);

  auto reply = json::parse(service.executeCommand(
      R"({"cmd": "ADVANCE_TIME", "seconds": 10})"));
  EXPECT_EQ(reply["code"], "NotSimulated");
}

// =============================================================================
// Telemetry rendering
// =============================================================================

TEST(TelemetryFormatTest, RendersEachEventType) {
  credit::LoanOpenedEvent opened;
  opened.loan_id = 3;
  opened.borrower = "alice";
  opened.principal = 1000;
  auto j = json::parse(credit::IpcServer::formatTelemetry(opened));
  EXPECT_EQ(j["type"], "loan_opened");
  EXPECT_EQ(j["loan_id"], 3);
  EXPECT_EQ(j["principal"], 1000);

  credit::LoanDefaultedEvent defaulted;
  defaulted.keeper = "bob";
  defaulted.bounty = 75;
  j = json::parse(credit::IpcServer::formatTelemetry(defaulted));
  EXPECT_EQ(j["type"], "loan_defaulted");
  EXPECT_EQ(j["keeper"], "bob");
  EXPECT_EQ(j["bounty"], 75);

  j = json::parse(credit::IpcServer::formatTelemetry(
      credit::LedgerPausedEvent{false, "admin", 9}));
  EXPECT_EQ(j["type"], "ledger_unpaused");
  EXPECT_EQ(j["timestamp"], 9);

  j = json::parse(
      credit::IpcServer::formatTelemetry(credit::LoanRepaidEvent{}));
  EXPECT_EQ(j["type"], "loan_repaid");
  EXPECT_EQ(j["fully_repaid"], false);
}
