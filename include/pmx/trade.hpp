#pragma once
#include "pmx/types.hpp"

namespace pmx {

struct Trade {
  TradeId  id{};
  Ts       ts{};

  Price    price{};   // maker's original price
  Qty      qty{};
  Side     side{Side::Yes};   // taker's original side

  OrderId  maker_order_id{};
  OrderId  taker_order_id{};
};

inline constexpr bool is_valid_trade(const Trade& t) noexcept {
  return (t.qty > 0) && (t.price >= kMinPrice) && (t.price <= kMaxPrice);
}

} // namespace pmx
