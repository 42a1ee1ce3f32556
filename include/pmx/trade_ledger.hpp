#pragma once
#include <cstddef>
#include <span>
#include <vector>

#include "pmx/trade.hpp"
#include "pmx/types.hpp"

namespace pmx {

// Append-only history of executed trades. Ids are assigned here, starting at 1.
class TradeLedger {
public:
  const Trade& record(Ts ts, Price px, Qty q, Side side, OrderId maker, OrderId taker);

  // Last n trades, most recent first.
  std::vector<Trade> recent(std::size_t n) const;

  std::span<const Trade> all() const noexcept { return trades_; }
  std::size_t size() const noexcept { return trades_.size(); }
  bool empty() const noexcept { return trades_.empty(); }

private:
  std::vector<Trade> trades_;
  TradeId next_trade_id_{1};
};

} // namespace pmx
