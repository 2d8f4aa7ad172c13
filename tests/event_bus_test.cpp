// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for credit::EventBus.
//
// Validates:
//   - Generic subscription receives every ledger event type
//   - Typed subscription receives only the matching type
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - A subscriber may publish from inside its callback
//   - Payload fields survive the variant dispatch
// =============================================================================

#include "credit/eventbus/event_bus.hpp"
#include "credit/events/event.hpp"

#include <gtest/gtest.h>

#include <string>

class EventBusTest : public ::testing::Test {
 protected:
  credit::EventBus bus;

  static credit::LoanOpenedEvent makeOpened(credit::domain::LoanId id,
                                            const std::string& borrower) {
    credit::LoanOpenedEvent e;
    e.loan_id = id;
    e.borrower = borrower;
    e.asset = "USDC";
    e.principal = 1000;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees every alternative.
// Why: The telemetry bridge subscribes generically; a skipped type would
//      silently vanish from the published stream.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int count = 0;
  bus.subscribe([&count](const credit::Event&) { ++count; });

  bus.publish(makeOpened(1, "alice"));
  bus.publish(credit::LoanRepaidEvent{});
  bus.publish(credit::LoanDefaultedEvent{});
  bus.publish(credit::LedgerPausedEvent{true, "admin", 0});

  EXPECT_EQ(count, 4);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Typed subscribers filter.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int defaults = 0;
  bus.subscribe<credit::LoanDefaultedEvent>(
      [&defaults](const credit::LoanDefaultedEvent&) { ++defaults; });

  bus.publish(makeOpened(1, "alice"));
  bus.publish(credit::LoanDefaultedEvent{});
  bus.publish(credit::LoanRepaidEvent{});

  EXPECT_EQ(defaults, 1);
}

// -----------------------------------------------------------------------------
// 3. Unsubscribe.
// Why: LedgerService drops its telemetry subscription on stop(); a callback
//      firing afterwards would push into a destroyed server.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int count = 0;
  auto id = bus.subscribe<credit::LoanOpenedEvent>(
      [&count](const credit::LoanOpenedEvent&) { ++count; });

  bus.publish(makeOpened(1, "alice"));
  bus.unsubscribe(id);
  bus.publish(makeOpened(2, "alice"));

  EXPECT_EQ(count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeOpened(3, "alice")));
}

// -----------------------------------------------------------------------------
// 4. Publishing from a callback must not deadlock.
// Why: publish() dispatches from a snapshot taken under the lock, so a
//      nested publish takes the lock afresh.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int paused_seen = 0;
  bus.subscribe<credit::LedgerPausedEvent>(
      [&paused_seen](const credit::LedgerPausedEvent&) { ++paused_seen; });
  bus.subscribe<credit::LoanDefaultedEvent>(
      [this](const credit::LoanDefaultedEvent& e) {
        bus.publish(credit::LedgerPausedEvent{true, e.keeper, e.timestamp});
      });

  credit::LoanDefaultedEvent d;
  d.keeper = "keeper";
  bus.publish(d);

  EXPECT_EQ(paused_seen, 1);
}

TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  credit::LoanRepaidEvent received;
  bus.subscribe<credit::LoanRepaidEvent>(
      [&received](const credit::LoanRepaidEvent& e) { received = e; });

  credit::LoanRepaidEvent sent;
  sent.loan_id = 42;
  sent.borrower = "alice";
  sent.paid_net = 502'739;
  sent.refund = 97'261;
  sent.total_repaid = 1'002'739;
  sent.total_debt = 1'002'739;
  sent.protocol_fee = 273;
  sent.fully_repaid = true;
  sent.timestamp = 1'864'000;
  bus.publish(sent);

  EXPECT_EQ(received.loan_id, 42u);
  EXPECT_EQ(received.borrower, "alice");
  EXPECT_EQ(received.paid_net, 502'739u);
  EXPECT_EQ(received.refund, 97'261u);
  EXPECT_EQ(received.protocol_fee, 273u);
  EXPECT_TRUE(received.fully_repaid);
  EXPECT_EQ(received.timestamp, 1'864'000u);
}
