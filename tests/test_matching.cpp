#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <utility>

#include "pmx/matching_engine.hpp"

namespace {

pmx::OrderRequest req(pmx::Side side, pmx::OrderType type, pmx::Price px, pmx::Qty qty, std::string account) {
  pmx::OrderRequest r{};
  r.side = side;
  r.type = type;
  r.price = px;
  r.qty = qty;
  r.account = std::move(account);
  return r;
}

constexpr auto YES  = pmx::Side::Yes;
constexpr auto NO   = pmx::Side::No;
constexpr auto BUY  = pmx::OrderType::Buy;
constexpr auto SELL = pmx::OrderType::Sell;

} // namespace

TEST(Matching, SellYesDoesNotMeetRestingBuyYes) {
  pmx::MatchingEngine eng;

  auto r1 = eng.place(req(YES, BUY, 60, 10, "A"), 1);
  EXPECT_EQ(r1.status, pmx::OrderStatus::Open);
  EXPECT_EQ(r1.remaining_qty, 10);
  EXPECT_EQ(eng.book(YES).size(), 1u);

  // SELL YES @50 is BUY NO @50 and looks at the (empty) NO book.
  auto r2 = eng.place(req(YES, SELL, 50, 4, "B"), 2);
  EXPECT_EQ(r2.status, pmx::OrderStatus::Open);
  EXPECT_TRUE(r2.trades.empty());
  EXPECT_EQ(r2.filled_qty, 0);
  EXPECT_EQ(r2.remaining_qty, 4);

  ASSERT_EQ(eng.book(NO).size(), 1u);
  EXPECT_EQ(eng.book(NO).peek_best().price, 50);
  EXPECT_EQ(eng.book(NO).peek_best().original_price, 50);
  EXPECT_EQ(eng.book(YES).peek_best().qty, 10);
}

TEST(Matching, SellNoCrossesRestingBuyYesAtMakerPrice) {
  pmx::MatchingEngine eng;

  (void)eng.place(req(YES, BUY, 60, 10, "A"), 1);
  auto r = eng.place(req(NO, SELL, 35, 5, "B"), 2);   // BUY YES @65

  EXPECT_EQ(r.order_id, 2u);
  EXPECT_EQ(r.status, pmx::OrderStatus::Filled);
  EXPECT_EQ(r.filled_qty, 5);
  EXPECT_EQ(r.remaining_qty, 0);

  ASSERT_EQ(r.trades.size(), 1u);
  const auto& t = r.trades[0];
  EXPECT_EQ(t.id, 1u);
  EXPECT_EQ(t.price, 60);
  EXPECT_EQ(t.qty, 5);
  EXPECT_EQ(t.side, NO);
  EXPECT_EQ(t.maker_order_id, 1u);
  EXPECT_EQ(t.taker_order_id, 2u);
  EXPECT_EQ(t.ts, 2);

  const auto maker = eng.find_order(1);
  ASSERT_TRUE(maker.has_value());
  EXPECT_EQ(maker->qty, 5);
  EXPECT_FALSE(eng.find_order(2).has_value());

  EXPECT_EQ(r.message, "Order 2: FILLED. Filled 5/5 shares in 1 trade(s).");
}

TEST(Matching, NonCrossingOrderRests) {
  pmx::MatchingEngine eng;

  (void)eng.place(req(YES, BUY, 60, 10, "A"), 1);
  auto r = eng.place(req(YES, BUY, 59, 3, "B"), 2);

  EXPECT_EQ(r.status, pmx::OrderStatus::Open);
  EXPECT_TRUE(r.trades.empty());
  EXPECT_EQ(eng.book(YES).size(), 2u);
  EXPECT_EQ(eng.book(YES).total_qty(), 13);
  EXPECT_EQ(r.message, "Order 2: OPEN. Filled 0/3 shares in 0 trade(s).");
}

TEST(Matching, HigherPriceBeforeEarlierTime) {
  pmx::MatchingEngine eng;

  // Same account, so they rest side by side instead of trading with each other.
  (void)eng.place(req(YES, BUY, 55, 5, "mm"), 1);  // id 1
  (void)eng.place(req(YES, BUY, 60, 5, "mm"), 2);  // id 2
  (void)eng.place(req(YES, BUY, 60, 5, "mm"), 3);  // id 3
  ASSERT_EQ(eng.book(YES).size(), 3u);

  auto r = eng.place(req(YES, BUY, 99, 12, "T"), 4);
  EXPECT_EQ(r.status, pmx::OrderStatus::Filled);

  ASSERT_EQ(r.trades.size(), 3u);
  EXPECT_EQ(r.trades[0].maker_order_id, 2u);
  EXPECT_EQ(r.trades[0].qty, 5);
  EXPECT_EQ(r.trades[1].maker_order_id, 3u);
  EXPECT_EQ(r.trades[1].qty, 5);
  EXPECT_EQ(r.trades[2].maker_order_id, 1u);
  EXPECT_EQ(r.trades[2].price, 55);
  EXPECT_EQ(r.trades[2].qty, 2);

  const auto left = eng.find_order(1);
  ASSERT_TRUE(left.has_value());
  EXPECT_EQ(left->qty, 3);
  EXPECT_EQ(eng.resting_count(), 1u);
}

TEST(Matching, EqualPriceAndTimeFallsBackToLowerId) {
  pmx::MatchingEngine eng;

  (void)eng.place(req(NO, BUY, 40, 1, "mm"), 7);   // id 1
  (void)eng.place(req(NO, BUY, 40, 1, "mm"), 7);   // id 2

  auto r = eng.place(req(NO, BUY, 40, 1, "T"), 8);
  ASSERT_EQ(r.trades.size(), 1u);
  EXPECT_EQ(r.trades[0].maker_order_id, 1u);
  EXPECT_EQ(eng.book(NO).peek_best().id, 2u);
}

TEST(Matching, SelfTradeIsSkippedAndSelfOrderKeepsItsPlace) {
  pmx::MatchingEngine eng;

  (void)eng.place(req(YES, BUY, 60, 5, "A"), 1);   // id 1
  (void)eng.place(req(YES, BUY, 55, 5, "A"), 2);   // id 2, same account: rests
  (void)eng.place(req(YES, BUY, 50, 5, "B"), 3);   // id 3, 50 < 60: rests

  auto r = eng.place(req(YES, BUY, 70, 5, "A"), 4);

  ASSERT_EQ(r.trades.size(), 1u);
  EXPECT_EQ(r.trades[0].maker_order_id, 3u);
  EXPECT_EQ(r.trades[0].price, 50);
  EXPECT_EQ(r.status, pmx::OrderStatus::Filled);

  // A's resting orders are untouched and still ahead of the book.
  const auto top = eng.book(YES).best(10);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].id, 1u);
  EXPECT_EQ(top[0].qty, 5);
  EXPECT_EQ(top[0].ts, 1);
  EXPECT_EQ(top[1].id, 2u);
  EXPECT_EQ(top[1].qty, 5);
}

TEST(Matching, SelfTradeSkipStillStopsAtNonCrossingPrice) {
  pmx::MatchingEngine eng;

  (void)eng.place(req(YES, BUY, 60, 5, "A"), 1);   // id 1
  (void)eng.place(req(YES, BUY, 58, 5, "A"), 2);   // id 2
  (void)eng.place(req(YES, BUY, 57, 5, "C"), 3);   // id 3, 57 < 60: rests

  auto r = eng.place(req(NO, SELL, 45, 4, "A"), 4);   // BUY YES @55, below C's 57
  EXPECT_TRUE(r.trades.empty());
  EXPECT_EQ(r.status, pmx::OrderStatus::Open);

  const auto top = eng.book(YES).best(10);
  ASSERT_EQ(top.size(), 4u);
  EXPECT_EQ(top[0].id, 1u);
  EXPECT_EQ(top[1].id, 2u);
  EXPECT_EQ(top[2].id, 3u);
  EXPECT_EQ(top[3].id, 4u);
  EXPECT_EQ(top[3].price, 55);
  EXPECT_EQ(top[3].original_price, 45);
}

TEST(Matching, MarketOrderSweepsAndRestsRemainderAtExtreme) {
  pmx::MatchingEngine eng;

  // Built best-first so no arrival crosses what is already resting.
  (void)eng.place(req(YES, BUY, 99, 2, "M"), 1);   // id 1, same account as taker
  (void)eng.place(req(YES, BUY, 95, 4, "C"), 2);   // id 2
  (void)eng.place(req(YES, BUY, 90, 3, "B"), 3);   // id 3
  ASSERT_EQ(eng.book(YES).size(), 3u);

  auto r = eng.place(req(NO, SELL, 0, 10, "M"), 4);   // market: BUY YES @100

  ASSERT_EQ(r.trades.size(), 2u);
  EXPECT_EQ(r.trades[0].maker_order_id, 2u);
  EXPECT_EQ(r.trades[0].price, 95);
  EXPECT_EQ(r.trades[0].qty, 4);
  EXPECT_EQ(r.trades[1].maker_order_id, 3u);
  EXPECT_EQ(r.trades[1].price, 90);
  EXPECT_EQ(r.trades[1].qty, 3);
  EXPECT_EQ(r.filled_qty, 7);
  EXPECT_EQ(r.remaining_qty, 3);
  EXPECT_EQ(r.status, pmx::OrderStatus::PartiallyFilled);

  const auto rest = eng.find_order(4);
  ASSERT_TRUE(rest.has_value());
  EXPECT_EQ(rest->price, 100);
  EXPECT_EQ(rest->original_price, 0);
  EXPECT_EQ(rest->qty, 3);

  // own order survived the sweep, and the market remainder now leads the book
  ASSERT_TRUE(eng.find_order(1).has_value());
  EXPECT_EQ(eng.find_order(1)->qty, 2);
  EXPECT_EQ(eng.book(YES).peek_best().id, 4u);
}

TEST(Matching, MarketBuySweepsEveryLevel) {
  pmx::MatchingEngine eng;

  (void)eng.place(req(NO, BUY, 80, 1, "B"), 1);
  (void)eng.place(req(NO, BUY, 20, 1, "C"), 2);
  (void)eng.place(req(NO, BUY, 1, 1, "D"), 3);

  auto r = eng.place(req(NO, BUY, 100, 5, "T"), 4);
  ASSERT_EQ(r.trades.size(), 3u);
  EXPECT_EQ(r.trades[2].price, 1);
  for (const auto& t : r.trades) EXPECT_EQ(t.ts, 4);   // every fill carries the taker's stamp
  EXPECT_EQ(r.remaining_qty, 2);
  EXPECT_EQ(eng.book(NO).size(), 1u);
}

TEST(Matching, PartialFillRestsRemainderOnOwnCanonicalBook) {
  pmx::MatchingEngine eng;

  (void)eng.place(req(YES, BUY, 60, 3, "A"), 1);
  auto r = eng.place(req(NO, SELL, 30, 10, "B"), 2);   // BUY YES @70

  EXPECT_EQ(r.status, pmx::OrderStatus::PartiallyFilled);
  EXPECT_EQ(r.filled_qty, 3);
  EXPECT_EQ(r.remaining_qty, 7);
  EXPECT_EQ(r.message, "Order 2: PARTIALLY_FILLED. Filled 3/10 shares in 1 trade(s).");

  ASSERT_EQ(eng.book(YES).size(), 1u);
  const auto& o = eng.book(YES).peek_best();
  EXPECT_EQ(o.id, 2u);
  EXPECT_EQ(o.price, 70);
  EXPECT_EQ(o.original_price, 30);
  EXPECT_EQ(o.side, NO);
  EXPECT_EQ(o.type, SELL);
  EXPECT_EQ(o.qty, 7);
  EXPECT_TRUE(eng.book(NO).empty());
}

TEST(Matching, OrderIdsAreUniqueAndIncreasing) {
  pmx::MatchingEngine eng;

  pmx::OrderId last = 0;
  for (int i = 0; i < 20; ++i) {
    auto r = eng.place(req((i % 2) ? YES : NO, (i % 3) ? BUY : SELL, 10 + i, 1, "u" + std::to_string(i % 4)), i);
    EXPECT_GT(r.order_id, last);
    last = r.order_id;
  }
  EXPECT_EQ(last, 20u);

  pmx::TradeId last_trade = 0;
  for (const auto& t : eng.ledger().all()) {
    EXPECT_GT(t.id, last_trade);
    last_trade = t.id;
  }
}

TEST(Matching, QuantityIsConserved) {
  pmx::MatchingEngine eng;

  std::mt19937_64 rng(7);
  std::uniform_int_distribution<int> side01(0, 1);
  std::uniform_int_distribution<int> type01(0, 1);
  std::uniform_int_distribution<int> px(0, 100);
  std::uniform_int_distribution<int> qty(1, 20);
  std::uniform_int_distribution<int> acct(0, 4);

  int64_t submitted = 0;
  int64_t taker_filled = 0;

  for (int i = 0; i < 500; ++i) {
    const auto q = static_cast<pmx::Qty>(qty(rng));
    auto r = eng.place(req(side01(rng) ? YES : NO,
                           type01(rng) ? BUY : SELL,
                           static_cast<pmx::Price>(px(rng)),
                           q,
                           "acct" + std::to_string(acct(rng))),
                       i);

    int64_t traded = 0;
    for (const auto& t : r.trades) {
      EXPECT_TRUE(pmx::is_valid_trade(t));
      EXPECT_NE(t.maker_order_id, t.taker_order_id);
      traded += t.qty;
    }
    EXPECT_EQ(traded, r.filled_qty);
    EXPECT_EQ(r.filled_qty + r.remaining_qty, q);

    submitted += r.filled_qty + r.remaining_qty;
    taker_filled += r.filled_qty;
  }

  int64_t ledger_qty = 0;
  for (const auto& t : eng.ledger().all()) ledger_qty += t.qty;
  EXPECT_EQ(ledger_qty, taker_filled);

  // every traded contract leaves one taker and one maker
  const int64_t resting = eng.book(YES).total_qty() + eng.book(NO).total_qty();
  EXPECT_EQ(submitted, resting + 2 * ledger_qty);
  EXPECT_EQ(eng.resting_count(), eng.book(YES).size() + eng.book(NO).size());
}

TEST(Matching, LargestAcceptedQuantitiesRestWithoutWrapping) {
  pmx::MatchingEngine eng;
  const pmx::Qty big = std::numeric_limits<pmx::Qty>::max();

  auto r1 = eng.place(req(YES, BUY, 10, big, "A"), 1);
  auto r2 = eng.place(req(YES, BUY, 10, big, "A"), 2);

  EXPECT_EQ(r1.remaining_qty, big);
  EXPECT_EQ(r2.remaining_qty, big);
  EXPECT_EQ(eng.book(YES).total_qty(), 2 * static_cast<int64_t>(big));

  // a full-size taker consumes exactly one of them
  auto r3 = eng.place(req(YES, BUY, 10, big, "B"), 3);
  EXPECT_EQ(r3.status, pmx::OrderStatus::Filled);
  EXPECT_EQ(eng.book(YES).total_qty(), static_cast<int64_t>(big));
}
