#pragma once
#include "pmx/types.hpp"

namespace pmx {

// Equivalent BUY of an order: side of the contract bought and the price paid for it.
struct CanonicalOrder {
  Side  side{Side::Yes};
  Price price{};

  friend bool operator==(const CanonicalOrder&, const CanonicalOrder&) = default;
};

// SELL S at P is the same economic position as BUY complement(S) at 100 - P.
inline constexpr CanonicalOrder normalize(Side side, OrderType type, Price price) noexcept {
  if (type == OrderType::Sell) return CanonicalOrder{complement(side), complement(price)};
  return CanonicalOrder{side, price};
}

// BUY at 100 or SELL at 0: priced to cross anything, so the crossing check is skipped.
inline constexpr bool is_market_order(OrderType type, Price price) noexcept {
  return (type == OrderType::Buy && price == kMaxPrice) ||
         (type == OrderType::Sell && price == kMinPrice);
}

} // namespace pmx
