#include "pmx/types.hpp"

#include <algorithm>
#include <cctype>

namespace pmx {

static bool iequals(std::string_view a, std::string_view b) noexcept {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::toupper(static_cast<unsigned char>(x)) ==
                  std::toupper(static_cast<unsigned char>(y));
         });
}

std::optional<Side> parse_side(std::string_view s) noexcept {
  if (iequals(s, "YES")) return Side::Yes;
  if (iequals(s, "NO")) return Side::No;
  return std::nullopt;
}

std::optional<OrderType> parse_order_type(std::string_view s) noexcept {
  if (iequals(s, "BUY")) return OrderType::Buy;
  if (iequals(s, "SELL")) return OrderType::Sell;
  return std::nullopt;
}

} // namespace pmx
