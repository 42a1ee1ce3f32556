#include "pmx/matching_engine.hpp"
#include "pmx/normalizer.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace pmx {

static std::string describe(const PlaceResult& r, Qty requested) {
  std::ostringstream oss;
  oss << "Order " << r.order_id << ": " << to_string(r.status) << ". Filled "
      << r.filled_qty << "/" << requested << " shares in " << r.trades.size() << " trade(s).";
  return oss.str();
}

static BookEntry to_entry(const Order& o) {
  return BookEntry{o.id, o.original_price, o.qty, o.account};
}

PlaceResult MatchingEngine::place(const OrderRequest& req, Ts ts) {
  PlaceResult out{};

  const CanonicalOrder c = normalize(req.side, req.type, req.price);
  const bool is_market = is_market_order(req.type, req.price);

  Order taker{};
  taker.id = next_order_id_++;
  taker.ts = ts;
  taker.account = req.account;
  taker.side = req.side;
  taker.type = req.type;
  taker.canonical_side = c.side;
  taker.price = c.price;
  taker.original_price = req.price;
  taker.qty = req.qty;

  out.order_id = taker.id;

  match(out.trades, taker, is_market);

  out.remaining_qty = taker.qty;
  out.filled_qty = req.qty - taker.qty;

  if (taker.qty > 0) {
    out.status = out.trades.empty() ? OrderStatus::Open : OrderStatus::PartiallyFilled;
    rest(std::move(taker));
  } else {
    out.status = OrderStatus::Filled;
  }

  out.message = describe(out, req.qty);
  return out;
}

void MatchingEngine::match(std::vector<Trade>& out, Order& taker, bool is_market) {
  // A canonical BUY meets resting canonical BUYs of the same contract.
  OrderQueue& book = book_mut(taker.canonical_side);

  // Own orders are held aside so the scan can reach the next price, then restored.
  std::vector<Order> skipped;

  while (taker.qty > 0 && !book.empty()) {
    const Order& best = book.peek_best();

    if (best.account == taker.account) {
      skipped.push_back(book.pop_best());
      continue;
    }

    // Nothing behind a non-crossing best order can cross either.
    if (!is_market && taker.price < best.price) break;

    Order maker = book.pop_best();
    const Qty q = std::min(taker.qty, maker.qty);

    out.push_back(ledger_.record(taker.ts, maker.original_price, q, taker.side, maker.id, taker.id));

    taker.qty -= q;
    maker.qty -= q;

    if (maker.qty > 0) {
      book.restore(std::move(maker));
    } else {
      index_.erase(maker.id);
    }
  }

  for (auto& o : skipped) book.restore(std::move(o));
}

void MatchingEngine::rest(Order o) {
  const Side side = o.canonical_side;
  index_[o.id] = Locator{side, o.key()};
  book_mut(side).push(std::move(o));
}

std::optional<Order> MatchingEngine::find_order(OrderId id) const {
  const auto it = index_.find(id);
  if (it == index_.end()) return std::nullopt;

  const Order* o = book(it->second.side).find(it->second.key);
  if (!o) return std::nullopt;
  return *o;
}

MarketSnapshot MatchingEngine::snapshot(std::size_t depth) const {
  MarketSnapshot s{};

  const auto yes = yes_book_.best(depth);
  const auto no  = no_book_.best(depth);

  // Bids: everything resting in a book is a bid for that book's contract.
  for (const auto& o : yes) {
    if ((o.type == OrderType::Buy && o.side == Side::Yes) ||
        (o.type == OrderType::Sell && o.side == Side::No)) {
      s.yes_bids.push_back(to_entry(o));
    }
  }
  for (const auto& o : no) {
    if ((o.type == OrderType::Buy && o.side == Side::No) ||
        (o.type == OrderType::Sell && o.side == Side::Yes)) {
      s.no_bids.push_back(to_entry(o));
    }
  }

  // Asks: a converted SELL is also shown as an offer on the contract it was sold in.
  for (const auto& o : no) {
    if (o.type == OrderType::Sell && o.side == Side::Yes) s.yes_asks.push_back(to_entry(o));
  }
  for (const auto& o : yes) {
    if (o.type == OrderType::Sell && o.side == Side::No) s.no_asks.push_back(to_entry(o));
  }

  return s;
}

} // namespace pmx
