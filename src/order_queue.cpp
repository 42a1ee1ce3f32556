#include "pmx/order_queue.hpp"

#include <algorithm>
#include <utility>

namespace pmx {

void OrderQueue::push(Order o) {
  const PriorityKey k = o.key();
  total_qty_ += o.qty;
  orders_.emplace(k, std::move(o));
}

Order OrderQueue::pop_best() {
  auto node = orders_.extract(orders_.begin());
  total_qty_ -= node.mapped().qty;
  return std::move(node.mapped());
}

std::vector<Order> OrderQueue::best(std::size_t n) const {
  std::vector<Order> out;
  out.reserve(std::min(n, orders_.size()));

  for (auto it = orders_.begin(); it != orders_.end() && out.size() < n; ++it) {
    out.push_back(it->second);
  }
  return out;
}

const Order* OrderQueue::find(const PriorityKey& key) const noexcept {
  const auto it = orders_.find(key);
  return (it == orders_.end()) ? nullptr : &it->second;
}

void OrderQueue::clear() noexcept {
  orders_.clear();
  total_qty_ = 0;
}

} // namespace pmx
