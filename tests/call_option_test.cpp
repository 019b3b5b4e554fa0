#include "../include/option/call_option.hpp"
#include "../include/option/clock.hpp"
#include "../include/option/fixed_point.hpp"
#include "../include/service/memory_transport.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace option;

class CallOptionTest : public ::testing::Test {
protected:
  static constexpr Timestamp START = 1700000000;
  static constexpr Timestamp DAY = 24 * 60 * 60;
  static constexpr Timestamp EXPIRY = START + 30 * DAY;

  void SetUp() override {
    clock = std::make_shared<ManualClock>(START);
    transport = std::make_shared<service::MemoryTransport>();
    instrument = makeInstrument(2 * PRICE_SCALE);
  }

  InstrumentParams makeParams(Amount strike) {
    InstrumentParams params;
    params.name = "Vault Call";
    params.symbol = "vCALL";
    params.issuer = "issuer";
    params.strike_price = strike;
    params.expiration = EXPIRY;
    return params;
  }

  std::unique_ptr<CallOption> makeInstrument(Amount strike) {
    return std::make_unique<CallOption>(makeParams(strike), transport, clock);
  }

  // Issue 10 and hand 3 to holder A.
  void issueAndDistribute() {
    ASSERT_EQ(instrument->issue("issuer", 10, 10), Status::OK);
    ASSERT_EQ(instrument->transfer("issuer", "A", 3), Status::OK);
  }

  std::shared_ptr<ManualClock> clock;
  std::shared_ptr<service::MemoryTransport> transport;
  std::unique_ptr<CallOption> instrument;
};

TEST_F(CallOptionTest, RejectsZeroStrike) {
  EXPECT_THROW(makeInstrument(0), std::invalid_argument);
}

TEST_F(CallOptionTest, RejectsExpirationNotAfterCreation) {
  auto params = makeParams(PRICE_SCALE);
  params.expiration = START;
  EXPECT_THROW(std::make_unique<CallOption>(params, transport, clock),
               std::invalid_argument);
}

TEST_F(CallOptionTest, RejectsForeignCollateral) {
  auto params = makeParams(PRICE_SCALE);
  params.collateral = CollateralKind::FOREIGN_ASSET;
  EXPECT_THROW(std::make_unique<CallOption>(params, transport, clock),
               UnsupportedCollateral);

  std::unique_ptr<CallOption> created;
  EXPECT_EQ(CallOption::create(params, transport, clock, created),
            Status::UNSUPPORTED);
  EXPECT_EQ(created, nullptr);
}

TEST_F(CallOptionTest, FactoryReportsInvalidParameters) {
  std::unique_ptr<CallOption> created;
  auto params = makeParams(PRICE_SCALE);
  params.issuer.clear();
  EXPECT_EQ(CallOption::create(params, transport, clock, created),
            Status::INVALID_PARAMETERS);
  EXPECT_EQ(created, nullptr);

  EXPECT_EQ(CallOption::create(makeParams(PRICE_SCALE), transport, clock,
                               created),
            Status::OK);
  ASSERT_NE(created, nullptr);
  EXPECT_EQ(created->getCreationTime(), START);
}

TEST_F(CallOptionTest, IssueMintsUnitsAndHoldsCollateral) {
  EXPECT_EQ(instrument->issue("issuer", 10, 10), Status::OK);

  auto info = instrument->info();
  EXPECT_EQ(info.total_supply, 10u);
  EXPECT_EQ(info.collateral_held, 10u);
  EXPECT_EQ(instrument->balanceOf("issuer"), 10u);
  EXPECT_EQ(instrument->balance(), 10u);
  EXPECT_TRUE(instrument->checkInvariant());
}

TEST_F(CallOptionTest, IssueRejectsNonIssuer) {
  EXPECT_EQ(instrument->issue("mallory", 10, 10), Status::UNAUTHORIZED);
  EXPECT_EQ(instrument->info().total_supply, 0u);
}

TEST_F(CallOptionTest, IssueRejectsZeroAmount) {
  EXPECT_EQ(instrument->issue("issuer", 0, 0), Status::ZERO_AMOUNT);
}

TEST_F(CallOptionTest, IssueRejectsDepositMismatch) {
  EXPECT_EQ(instrument->issue("issuer", 10, 9), Status::AMOUNT_MISMATCH);
  EXPECT_EQ(instrument->issue("issuer", 10, 11), Status::AMOUNT_MISMATCH);
  EXPECT_EQ(instrument->balance(), 0u);
  EXPECT_EQ(instrument->info().collateral_held, 0u);
}

TEST_F(CallOptionTest, ExerciseWindowBoundaries) {
  EXPECT_FALSE(instrument->isExercisable(EXPIRY - WINDOW - 1));
  EXPECT_TRUE(instrument->isExercisable(EXPIRY - WINDOW));
  EXPECT_TRUE(instrument->isExercisable(EXPIRY));
  EXPECT_FALSE(instrument->isExercisable(EXPIRY + 1));
}

TEST_F(CallOptionTest, ExerciseAtWindowEdges) {
  issueAndDistribute();

  clock->set(EXPIRY - WINDOW - 1);
  EXPECT_EQ(instrument->exercise("A", 1, 2), Status::NOT_IN_EXERCISE_WINDOW);

  clock->set(EXPIRY - WINDOW);
  EXPECT_EQ(instrument->exercise("A", 1, 2), Status::OK);

  clock->set(EXPIRY);
  EXPECT_EQ(instrument->exercise("A", 1, 2), Status::OK);

  clock->set(EXPIRY + 1);
  EXPECT_EQ(instrument->exercise("A", 1, 2), Status::NOT_IN_EXERCISE_WINDOW);
  EXPECT_EQ(instrument->balanceOf("A"), 1u);
}

TEST_F(CallOptionTest, QuoteTruncatesTowardZero) {
  // 1.5 collateral per unit
  auto fractional = makeInstrument(PRICE_SCALE + PRICE_SCALE / 2);
  EXPECT_EQ(fractional->quote(1).value(), Amount{1});
  EXPECT_EQ(fractional->quote(2).value(), Amount{3});
  EXPECT_EQ(fractional->quote(3).value(), Amount{4});

  auto tiny = makeInstrument(1);
  EXPECT_EQ(tiny->quote(PRICE_SCALE - 1).value(), Amount{0});
  EXPECT_EQ(tiny->quote(PRICE_SCALE).value(), Amount{1});
  EXPECT_EQ(tiny->quote(2 * PRICE_SCALE - 1).value(), Amount{1});
}

TEST_F(CallOptionTest, QuoteReportsOverflow) {
  auto huge = makeInstrument(UINT64_MAX);
  EXPECT_FALSE(huge->quote(UINT64_MAX).has_value());
  EXPECT_EQ(huge->quote(PRICE_SCALE).value(), Amount{UINT64_MAX});
}

TEST_F(CallOptionTest, ExerciseChargesQuotedPayment) {
  instrument = makeInstrument(PRICE_SCALE + PRICE_SCALE / 2);
  issueAndDistribute();
  clock->set(EXPIRY - DAY / 2);

  auto required = instrument->quote(3);
  ASSERT_TRUE(required.has_value());
  EXPECT_EQ(instrument->exercise("A", 3, *required - 1),
            Status::INSUFFICIENT_PAYMENT);
  EXPECT_EQ(instrument->exercise("A", 3, *required), Status::OK);

  auto events = instrument->events();
  ASSERT_EQ(events.size(), 2u);
  const auto &exercised = std::get<Exercised>(events.back().payload);
  EXPECT_EQ(exercised.payment_taken, *required);
  EXPECT_EQ(exercised.collateral_released, 3u);
}

TEST_F(CallOptionTest, ExerciseRejectsInsufficientUnits) {
  issueAndDistribute();
  clock->set(EXPIRY - DAY / 2);

  EXPECT_EQ(instrument->exercise("A", 4, 8),
            Status::INSUFFICIENT_UNIT_BALANCE);
  EXPECT_EQ(instrument->exercise("nobody", 1, 2),
            Status::INSUFFICIENT_UNIT_BALANCE);
  EXPECT_EQ(instrument->balanceOf("A"), 3u);
}

TEST_F(CallOptionTest, ExerciseRejectsZeroUnits) {
  issueAndDistribute();
  clock->set(EXPIRY - DAY / 2);
  EXPECT_EQ(instrument->exercise("A", 0, 0), Status::ZERO_AMOUNT);
}

// Scenario 1: exact payment
TEST_F(CallOptionTest, ExerciseWithExactPayment) {
  issueAndDistribute();
  clock->set(EXPIRY - DAY / 2);

  EXPECT_EQ(instrument->exercise("A", 1, 2), Status::OK);

  EXPECT_EQ(instrument->balanceOf("A"), 2u);
  auto info = instrument->info();
  EXPECT_EQ(info.total_supply, 9u);
  EXPECT_EQ(info.collateral_held, 9u);
  EXPECT_EQ(transport->receivedBy("A"), 1u);
  EXPECT_EQ(instrument->balance(), 11u); // 10 - 1 released + 2 paid
  EXPECT_TRUE(instrument->checkInvariant());
}

// Scenario 2: overpayment is refunded
TEST_F(CallOptionTest, ExerciseRefundsExcessPayment) {
  issueAndDistribute();
  clock->set(EXPIRY - DAY / 2);

  EXPECT_EQ(instrument->exercise("A", 1, 3), Status::OK);

  EXPECT_EQ(instrument->balanceOf("A"), 2u);
  EXPECT_EQ(instrument->info().total_supply, 9u);
  EXPECT_EQ(instrument->info().collateral_held, 9u);
  EXPECT_EQ(transport->receivedBy("A"), 2u); // 1 refund + 1 collateral
  EXPECT_EQ(transport->getDeliveryCount(), 2u);
  EXPECT_EQ(instrument->balance(), 11u);
}

// Scenario 3: outside the window nothing changes
TEST_F(CallOptionTest, ExerciseOutsideWindowChangesNothing) {
  issueAndDistribute();
  clock->set(EXPIRY - 2 * DAY);

  EXPECT_EQ(instrument->exercise("A", 1, 2), Status::NOT_IN_EXERCISE_WINDOW);

  EXPECT_EQ(instrument->balanceOf("A"), 3u);
  EXPECT_EQ(instrument->info().total_supply, 10u);
  EXPECT_EQ(instrument->info().collateral_held, 10u);
  EXPECT_EQ(instrument->balance(), 10u);
  EXPECT_EQ(transport->totalDelivered(), 0u);
  EXPECT_EQ(instrument->events().size(), 1u);
}

// Scenario 4: sweep after expiry, then terminal
TEST_F(CallOptionTest, ExpireSweepsRemainingCollateral) {
  issueAndDistribute();
  clock->set(EXPIRY - DAY / 2);
  ASSERT_EQ(instrument->exercise("A", 1, 2), Status::OK);

  clock->set(EXPIRY + DAY);
  EXPECT_EQ(instrument->expire("issuer"), Status::OK);

  auto info = instrument->info();
  EXPECT_TRUE(info.expired);
  EXPECT_FALSE(info.can_exercise);
  EXPECT_EQ(info.collateral_held, 0u);
  EXPECT_EQ(transport->receivedBy("issuer"), 9u);
  EXPECT_EQ(instrument->balance(), 2u); // the strike payment stays
  EXPECT_TRUE(instrument->checkInvariant());

  EXPECT_EQ(instrument->expire("issuer"), Status::ALREADY_EXPIRED);
  EXPECT_EQ(transport->receivedBy("issuer"), 9u);
}

TEST_F(CallOptionTest, ExpireRequiresIssuerAndExpiry) {
  issueAndDistribute();

  clock->set(EXPIRY - 1);
  EXPECT_EQ(instrument->expire("issuer"), Status::NOT_YET_EXPIRABLE);

  clock->set(EXPIRY);
  EXPECT_EQ(instrument->expire("A"), Status::UNAUTHORIZED);
  EXPECT_FALSE(instrument->isExpired());
  EXPECT_EQ(instrument->expire("issuer"), Status::OK);
}

TEST_F(CallOptionTest, ExpireWithNothingHeldStillTransitions) {
  clock->set(EXPIRY);
  EXPECT_EQ(instrument->expire("issuer"), Status::OK);
  EXPECT_TRUE(instrument->isExpired());
  EXPECT_EQ(transport->getDeliveryCount(), 0u);

  auto events = instrument->events();
  ASSERT_EQ(events.size(), 1u);
  const auto &expired = std::get<Expired>(events[0].payload);
  EXPECT_EQ(expired.issuer, "issuer");
  EXPECT_EQ(expired.collateral_swept, 0u);
}

TEST_F(CallOptionTest, ExpiredInstrumentRejectsIssueAndExercise) {
  issueAndDistribute();
  clock->set(EXPIRY);
  ASSERT_EQ(instrument->expire("issuer"), Status::OK);

  // Still inside the window, but the state is terminal.
  EXPECT_EQ(instrument->exercise("A", 1, 2), Status::ALREADY_EXPIRED);
  EXPECT_EQ(instrument->issue("issuer", 5, 5), Status::ALREADY_EXPIRED);
  EXPECT_TRUE(instrument->isExpired());
}

TEST_F(CallOptionTest, PayoutFailureRollsBackExercise) {
  issueAndDistribute();
  clock->set(EXPIRY - DAY / 2);
  transport->refuse("A");

  EXPECT_EQ(instrument->exercise("A", 1, 3), Status::TRANSFER_FAILED);

  EXPECT_EQ(instrument->balanceOf("A"), 3u);
  EXPECT_EQ(instrument->info().total_supply, 10u);
  EXPECT_EQ(instrument->info().collateral_held, 10u);
  EXPECT_EQ(instrument->balance(), 10u);
  EXPECT_EQ(instrument->events().size(), 1u);
  EXPECT_TRUE(instrument->checkInvariant());
}

TEST_F(CallOptionTest, SecondLegFailureReclaimsRefund) {
  issueAndDistribute();
  clock->set(EXPIRY - DAY / 2);

  int deliveries = 0;
  transport->setReceiveHook([&deliveries](const std::string &, uint64_t) {
    return ++deliveries < 2;
  });

  EXPECT_EQ(instrument->exercise("A", 1, 5), Status::TRANSFER_FAILED);
  EXPECT_EQ(deliveries, 2);
  EXPECT_EQ(transport->receivedBy("A"), 0u);
  EXPECT_EQ(instrument->balanceOf("A"), 3u);
  EXPECT_EQ(instrument->balance(), 10u);
}

TEST_F(CallOptionTest, SweepFailureKeepsInstrumentActive) {
  issueAndDistribute();
  clock->set(EXPIRY);
  transport->refuse("issuer");

  EXPECT_EQ(instrument->expire("issuer"), Status::TRANSFER_FAILED);
  EXPECT_FALSE(instrument->isExpired());
  EXPECT_EQ(instrument->info().collateral_held, 10u);

  transport->refuse("issuer", false);
  EXPECT_EQ(instrument->expire("issuer"), Status::OK);
  EXPECT_EQ(transport->receivedBy("issuer"), 10u);
}

TEST_F(CallOptionTest, InfoReportsExercisability) {
  issueAndDistribute();
  EXPECT_FALSE(instrument->info().can_exercise);

  clock->set(EXPIRY - WINDOW);
  auto info = instrument->info();
  EXPECT_TRUE(info.can_exercise);
  EXPECT_EQ(info.strike_price, 2 * PRICE_SCALE);
  EXPECT_EQ(info.expiration, EXPIRY);
  EXPECT_EQ(info.symbol, "vCALL");
}

TEST_F(CallOptionTest, BalanceIncludesOutOfBandValue) {
  issueAndDistribute();
  clock->set(EXPIRY - DAY / 2);
  ASSERT_EQ(instrument->exercise("A", 2, 4), Status::OK);

  // Strike payments accumulate beside the collateral.
  EXPECT_GT(instrument->balance(), instrument->info().collateral_held);
}

TEST_F(CallOptionTest, EventsCarrySequenceAndReachSubscribers) {
  std::vector<Event> received;
  size_t id = instrument->subscribe(
      [&received](const Event &event) { received.push_back(event); });

  issueAndDistribute();
  clock->set(EXPIRY - DAY / 2);
  ASSERT_EQ(instrument->exercise("A", 1, 2), Status::OK);
  ASSERT_EQ(instrument->exercise("A", 9, 18),
            Status::INSUFFICIENT_UNIT_BALANCE);

  instrument->unsubscribe(id);
  clock->set(EXPIRY);
  ASSERT_EQ(instrument->expire("issuer"), Status::OK);

  ASSERT_EQ(received.size(), 2u);
  EXPECT_STREQ(eventName(received[0]), "Issued");
  EXPECT_STREQ(eventName(received[1]), "Exercised");

  auto log = instrument->events();
  ASSERT_EQ(log.size(), 3u);
  for (size_t i = 0; i < log.size(); ++i) {
    EXPECT_EQ(log[i].sequence, i + 1);
  }
  EXPECT_EQ(log[2].timestamp, EXPIRY);

  auto json = toJson(log[1]);
  EXPECT_EQ(json["event"], "Exercised");
  EXPECT_EQ(json["data"]["holder"], "A");
  EXPECT_EQ(json["data"]["payment_taken"], 2);
}

TEST_F(CallOptionTest, DelegatedTransfers) {
  issueAndDistribute();

  EXPECT_EQ(instrument->transferFrom("B", "A", "B", 1), Status::UNAUTHORIZED);
  EXPECT_EQ(instrument->approve("A", "B", 2), Status::OK);
  EXPECT_EQ(instrument->allowance("A", "B"), 2u);
  EXPECT_EQ(instrument->transferFrom("B", "A", "B", 2), Status::OK);
  EXPECT_EQ(instrument->balanceOf("B"), 2u);
  EXPECT_EQ(instrument->allowance("A", "B"), 0u);
  EXPECT_EQ(instrument->transfer("A", "B", 5),
            Status::INSUFFICIENT_UNIT_BALANCE);
  EXPECT_TRUE(instrument->checkInvariant());
}

TEST_F(CallOptionTest, DelegatedTransferDistinguishesAllowanceFromBalance) {
  issueAndDistribute();

  ASSERT_EQ(instrument->approve("A", "B", 10), Status::OK);
  EXPECT_EQ(instrument->transferFrom("B", "A", "C", 4),
            Status::INSUFFICIENT_UNIT_BALANCE);
  EXPECT_EQ(instrument->allowance("A", "B"), 10u);

  ASSERT_EQ(instrument->approve("A", "B", 0), Status::OK);
  EXPECT_EQ(instrument->transferFrom("B", "A", "C", 1), Status::UNAUTHORIZED);
  EXPECT_EQ(instrument->balanceOf("A"), 3u);
  EXPECT_EQ(instrument->balanceOf("C"), 0u);
}

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
