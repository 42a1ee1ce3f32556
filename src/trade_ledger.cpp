#include "pmx/trade_ledger.hpp"

#include <algorithm>

namespace pmx {

const Trade& TradeLedger::record(Ts ts, Price px, Qty q, Side side, OrderId maker, OrderId taker) {
  Trade t{};
  t.id = next_trade_id_++;
  t.ts = ts;
  t.price = px;
  t.qty = q;
  t.side = side;
  t.maker_order_id = maker;
  t.taker_order_id = taker;

  trades_.push_back(t);
  return trades_.back();
}

std::vector<Trade> TradeLedger::recent(std::size_t n) const {
  const std::size_t k = std::min(n, trades_.size());
  std::vector<Trade> out;
  out.reserve(k);

  // newest-first
  for (auto it = trades_.rbegin(); it != trades_.rbegin() + static_cast<std::ptrdiff_t>(k); ++it) {
    out.push_back(*it);
  }
  return out;
}

} // namespace pmx
