#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "pmx/order.hpp"
#include "pmx/types.hpp"

namespace pmx {

// Resting canonical BUY orders of one contract, best priority first.
//
// Ordered by PriorityKey (price desc, ts asc, id asc). The key is taken from the order
// when it is pushed and is never recomputed, so pop + restore leaves an order exactly
// where it was.
class OrderQueue {
public:
  explicit OrderQueue(Side side = Side::Yes) noexcept : side_(side) {}

  Side side() const noexcept { return side_; }

  void push(Order o);

  // Reinsert an order taken out with pop_best(); its key must be unchanged.
  void restore(Order o) { push(std::move(o)); }

  // Preconditions: !empty()
  const Order& peek_best() const noexcept { return orders_.begin()->second; }
  Order pop_best();

  // Non-destructive read of up to n best orders, in priority order.
  std::vector<Order> best(std::size_t n) const;

  const Order* find(const PriorityKey& key) const noexcept;

  bool empty() const noexcept { return orders_.empty(); }
  std::size_t size() const noexcept { return orders_.size(); }
  // Sum of many orders can exceed Qty.
  int64_t total_qty() const noexcept { return total_qty_; }

  void clear() noexcept;

private:
  Side side_{Side::Yes};
  std::map<PriorityKey, Order> orders_;
  int64_t total_qty_{0};
};

} // namespace pmx
