#pragma once
#include <tuple>

#include "pmx/types.hpp"

namespace pmx {

// Order intent as submitted at the boundary.
struct OrderRequest {
  Side      side{Side::Yes};
  OrderType type{OrderType::Buy};
  Price     price{};
  Qty       qty{};
  AccountId account{};
};

// Heap position of a resting order. Fixed at creation; quantity changes never move it.
struct PriorityKey {
  Price   price{};   // canonical price
  Ts      ts{};
  OrderId id{};

  // Better price first, then earlier time, then lower id.
  friend bool operator<(const PriorityKey& a, const PriorityKey& b) noexcept {
    if (a.price != b.price) return a.price > b.price;
    return std::tie(a.ts, a.id) < std::tie(b.ts, b.id);
  }
  friend bool operator==(const PriorityKey& a, const PriorityKey& b) noexcept {
    return a.price == b.price && a.ts == b.ts && a.id == b.id;
  }
};

// Canonical BUY order. side/type/original_price keep the submitted form for display.
struct Order {
  OrderId   id{};
  Ts        ts{};
  AccountId account{};

  Side      side{Side::Yes};          // original side
  OrderType type{OrderType::Buy};     // original type

  Side      canonical_side{Side::Yes};
  Price     price{};                  // canonical price, used for matching and ordering
  Price     original_price{};         // execution price when this order is the maker

  Qty       qty{};                    // remaining qty (must be > 0 while resting)

  PriorityKey key() const noexcept { return PriorityKey{price, ts, id}; }
};

} // namespace pmx
