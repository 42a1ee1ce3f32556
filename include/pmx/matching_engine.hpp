#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pmx/order.hpp"
#include "pmx/order_queue.hpp"
#include "pmx/trade.hpp"
#include "pmx/trade_ledger.hpp"
#include "pmx/types.hpp"

namespace pmx {

enum class OrderStatus : uint8_t { Open = 0, PartiallyFilled = 1, Filled = 2 };

inline std::string_view to_string(OrderStatus s) noexcept {
  switch (s) {
    case OrderStatus::Open:            return "OPEN";
    case OrderStatus::PartiallyFilled: return "PARTIALLY_FILLED";
    case OrderStatus::Filled:          return "FILLED";
  }
  return "OPEN";
}

struct EngineConfig {
  std::size_t snapshot_depth{10};
  std::size_t default_trade_limit{20};
};

struct PlaceResult {
  OrderId order_id{};
  OrderStatus status{OrderStatus::Open};
  Qty filled_qty{0};
  Qty remaining_qty{0};
  std::vector<Trade> trades;   // execution order
  std::string message;
};

// One row of the four-sided market view.
struct BookEntry {
  OrderId   order_id{};
  Price     price{};   // original price
  Qty       qty{};     // remaining
  AccountId account{};
};

struct MarketSnapshot {
  std::vector<BookEntry> yes_bids;
  std::vector<BookEntry> yes_asks;
  std::vector<BookEntry> no_bids;
  std::vector<BookEntry> no_asks;
};

// Single-market engine over two canonical books.
//
// Every order is rewritten as a BUY of YES or NO and matched against the book of the
// same contract. Not thread-safe: Exchange serializes access.
class MatchingEngine {
public:
  MatchingEngine() = default;
  explicit MatchingEngine(EngineConfig cfg) : cfg_(cfg) {}

  const EngineConfig& config() const noexcept { return cfg_; }

  // Preconditions: req passed validate(); price in [0,100], qty >= 1.
  // ts stamps the order and every trade it takes: matching runs to completion without
  // waiting, so arrival time is also execution time.
  PlaceResult place(const OrderRequest& req, Ts ts);

  MarketSnapshot snapshot(std::size_t depth) const;
  MarketSnapshot snapshot() const { return snapshot(cfg_.snapshot_depth); }

  std::vector<Trade> recent_trades(std::size_t n) const { return ledger_.recent(n); }

  std::optional<Order> find_order(OrderId id) const;

  const OrderQueue& book(Side side) const noexcept {
    return (side == Side::Yes) ? yes_book_ : no_book_;
  }
  const TradeLedger& ledger() const noexcept { return ledger_; }
  std::size_t resting_count() const noexcept { return index_.size(); }

private:
  EngineConfig cfg_{};

  OrderQueue yes_book_{Side::Yes};
  OrderQueue no_book_{Side::No};

  TradeLedger ledger_{};
  OrderId next_order_id_{1};

  struct Locator {
    Side side{};
    PriorityKey key{};
  };
  std::unordered_map<OrderId, Locator> index_;

  OrderQueue& book_mut(Side side) noexcept {
    return (side == Side::Yes) ? yes_book_ : no_book_;
  }

  void match(std::vector<Trade>& out, Order& taker, bool is_market);
  void rest(Order o);
};

} // namespace pmx
