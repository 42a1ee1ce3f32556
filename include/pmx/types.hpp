#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pmx {

using Price     = int32_t;   // cents of a contract paying 100
using Qty       = int32_t;   // contracts
using OrderId   = uint64_t;
using TradeId   = uint64_t;
using AccountId = std::string;
using Ts        = int64_t;   // nanoseconds since the Unix epoch

inline constexpr Price kMinPrice = 0;
inline constexpr Price kMaxPrice = 100;

// Contract the order refers to.
enum class Side : uint8_t { Yes = 0, No = 1 };

enum class OrderType : uint8_t { Buy = 0, Sell = 1 };

inline constexpr Side complement(Side s) noexcept {
  return (s == Side::Yes) ? Side::No : Side::Yes;
}

// Price of the complementary contract: holding YES and NO together pays exactly 100.
inline constexpr Price complement(Price p) noexcept {
  return kMaxPrice - p;
}

inline std::string_view to_string(Side s) noexcept {
  return (s == Side::Yes) ? "YES" : "NO";
}

inline std::string_view to_string(OrderType t) noexcept {
  return (t == OrderType::Buy) ? "BUY" : "SELL";
}

// Case-insensitive parsers used by the HTTP boundary.
std::optional<Side> parse_side(std::string_view s) noexcept;
std::optional<OrderType> parse_order_type(std::string_view s) noexcept;

} // namespace pmx
