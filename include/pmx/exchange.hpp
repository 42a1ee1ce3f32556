#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "pmx/matching_engine.hpp"
#include "pmx/order.hpp"
#include "pmx/trade.hpp"
#include "pmx/types.hpp"

namespace pmx {

using Clock = std::function<Ts()>;

// Wall clock in nanoseconds since the epoch.
Ts system_now() noexcept;

// Thread-safe front of the engine used by the gateway.
//
// One mutex guards the whole engine state; every call holds it from start to finish, so
// readers never see a matching loop half-way.
class Exchange {
public:
  explicit Exchange(EngineConfig cfg = {}, Clock clock = system_now);

  Exchange(const Exchange&) = delete;
  Exchange& operator=(const Exchange&) = delete;

  PlaceResult place(const OrderRequest& req);

  MarketSnapshot snapshot() const;
  MarketSnapshot snapshot(std::size_t depth) const;

  std::vector<Trade> recent_trades(std::size_t limit) const;
  std::optional<Order> find_order(OrderId id) const;

  // Drop every order and trade; ids start again at 1.
  void reset();

  const EngineConfig& config() const noexcept { return cfg_; }

private:
  EngineConfig cfg_{};
  Clock clock_;

  mutable std::mutex engine_mtx_;
  MatchingEngine engine_;
};

} // namespace pmx
