#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pmx/matching_engine.hpp"
#include "pmx/order.hpp"
#include "pmx/trade.hpp"
#include "pmx/validation.hpp"

namespace pmx::api {

// Same layout as httplib::Params, so request params pass straight through.
using Params = std::multimap<std::string, std::string>;

// Reads side/type/price/quantity/account_id and validates them.
Validation parse_order_request(const Params& params, OrderRequest& out);

// Same fields from an application/json body: strings for side/type/account_id,
// integers (or integer strings) for price/quantity.
Validation parse_order_json(std::string_view body, OrderRequest& out);

// `limit` query parameter; absent means def.
Validation parse_limit(const Params& params, std::size_t def, std::size_t& out);

std::optional<int64_t> parse_int(std::string_view s) noexcept;

std::string json_escape(std::string_view s);

std::string to_json(const Trade& t);
std::string to_json(const std::vector<Trade>& trades);
std::string to_json(const PlaceResult& r);
std::string to_json(const MarketSnapshot& s);
std::string to_json(const Order& o);

std::string message_json(std::string_view message);
std::string error_json(std::string_view detail);

} // namespace pmx::api
