#include "pmx/exchange.hpp"

#include <chrono>
#include <utility>

namespace pmx {

Ts system_now() noexcept {
  using namespace std::chrono;
  return duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
}

Exchange::Exchange(EngineConfig cfg, Clock clock)
  : cfg_(cfg), clock_(std::move(clock)), engine_(cfg) {}

PlaceResult Exchange::place(const OrderRequest& req) {
  std::lock_guard<std::mutex> lk(engine_mtx_);
  // stamped under the lock so time priority follows arrival order
  return engine_.place(req, clock_());
}

MarketSnapshot Exchange::snapshot() const {
  return snapshot(cfg_.snapshot_depth);
}

MarketSnapshot Exchange::snapshot(std::size_t depth) const {
  std::lock_guard<std::mutex> lk(engine_mtx_);
  return engine_.snapshot(depth);
}

std::vector<Trade> Exchange::recent_trades(std::size_t limit) const {
  std::lock_guard<std::mutex> lk(engine_mtx_);
  return engine_.recent_trades(limit);
}

std::optional<Order> Exchange::find_order(OrderId id) const {
  std::lock_guard<std::mutex> lk(engine_mtx_);
  return engine_.find_order(id);
}

void Exchange::reset() {
  std::lock_guard<std::mutex> lk(engine_mtx_);
  engine_ = MatchingEngine{cfg_};
}

} // namespace pmx
