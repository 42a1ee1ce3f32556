#include "pmx/api.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace pmx::api {

namespace {

// Raw order fields as they arrive, before any interpretation.
struct OrderFields {
  std::optional<std::string> side;
  std::optional<std::string> type;
  std::optional<std::string> price;
  std::optional<std::string> quantity;
  std::optional<std::string> account_id;
};

std::optional<std::string> param(const Params& params, const char* key) {
  const auto it = params.find(key);
  if (it == params.end()) return std::nullopt;
  return it->second;
}

Validation reject(RejectReason r, std::string detail) {
  return Validation{r, std::move(detail)};
}

Validation from_fields(const OrderFields& f, OrderRequest& out) {
  if (!f.side)       return reject(RejectReason::MissingField, "side is required");
  if (!f.type)       return reject(RejectReason::MissingField, "type is required");
  if (!f.price)      return reject(RejectReason::MissingField, "price is required");
  if (!f.quantity)   return reject(RejectReason::MissingField, "quantity is required");
  if (!f.account_id) return reject(RejectReason::MissingField, "account_id is required");

  const auto side = parse_side(*f.side);
  if (!side) return reject(RejectReason::InvalidSide, "side must be YES or NO, got '" + *f.side + "'");

  const auto type = parse_order_type(*f.type);
  if (!type) return reject(RejectReason::InvalidType, "type must be BUY or SELL, got '" + *f.type + "'");

  const auto price = parse_int(*f.price);
  if (!price) return reject(RejectReason::InvalidNumber, "price must be an integer, got '" + *f.price + "'");
  if (*price < std::numeric_limits<Price>::min() || *price > std::numeric_limits<Price>::max()) {
    return reject(RejectReason::PriceOutOfRange,
                  "price must be between " + std::to_string(kMinPrice) + " and " +
                  std::to_string(kMaxPrice) + ", got " + *f.price);
  }

  const auto qty = parse_int(*f.quantity);
  if (!qty) return reject(RejectReason::InvalidNumber, "quantity must be an integer, got '" + *f.quantity + "'");
  if (*qty < std::numeric_limits<Qty>::min() || *qty > std::numeric_limits<Qty>::max()) {
    return reject(RejectReason::InvalidNumber, "quantity is out of range, got " + *f.quantity);
  }

  OrderRequest req{};
  req.side = *side;
  req.type = *type;
  req.price = static_cast<Price>(*price);
  req.qty = static_cast<Qty>(*qty);
  req.account = *f.account_id;

  Validation v = validate(req);
  if (v.ok()) out = std::move(req);
  return v;
}

// Strings pass through; integral numbers are spelled out so both encodings share one parser.
std::optional<std::string> json_field(const nlohmann::json& j, const char* key, bool& bad) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  if (it->is_string()) return it->get<std::string>();
  if (it->is_number_unsigned()) return std::to_string(it->get<uint64_t>());
  if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
  bad = true;
  return it->dump();
}

// Trade/order timestamps are reported in fractional seconds.
void put_seconds(std::ostringstream& oss, Ts ts) {
  oss << std::fixed << std::setprecision(6) << (static_cast<double>(ts) / 1e9);
  oss.unsetf(std::ios_base::floatfield);
}

void put_entries(std::ostringstream& oss, const std::vector<BookEntry>& xs) {
  oss << "[";
  for (std::size_t i = 0; i < xs.size(); ++i) {
    const auto& e = xs[i];
    if (i) oss << ",";
    oss << "{"
        << "\"order_id\":" << e.order_id << ","
        << "\"price\":" << e.price << ","
        << "\"quantity\":" << e.qty << ","
        << "\"account_id\":\"" << json_escape(e.account) << "\""
        << "}";
  }
  oss << "]";
}

void put_trade(std::ostringstream& oss, const Trade& t) {
  oss << "{";
  oss << "\"trade_id\":" << t.id << ",";
  oss << "\"maker_order_id\":" << t.maker_order_id << ",";
  oss << "\"taker_order_id\":" << t.taker_order_id << ",";
  oss << "\"price\":" << t.price << ",";
  oss << "\"quantity\":" << t.qty << ",";
  oss << "\"side\":\"" << to_string(t.side) << "\",";
  oss << "\"timestamp\":";
  put_seconds(oss, t.ts);
  oss << "}";
}

} // namespace

std::optional<int64_t> parse_int(std::string_view s) noexcept {
  if (!s.empty() && s.front() == '+') {
    s.remove_prefix(1);
    // one sign only
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) return std::nullopt;
  }
  if (s.empty()) return std::nullopt;

  int64_t v = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

Validation parse_order_request(const Params& params, OrderRequest& out) {
  OrderFields f{};
  f.side       = param(params, "side");
  f.type       = param(params, "type");
  f.price      = param(params, "price");
  f.quantity   = param(params, "quantity");
  f.account_id = param(params, "account_id");
  return from_fields(f, out);
}

Validation parse_order_json(std::string_view body, OrderRequest& out) {
  const auto j = nlohmann::json::parse(body.begin(), body.end(), nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return reject(RejectReason::MalformedBody, "request body is not valid JSON");
  if (!j.is_object()) return reject(RejectReason::MalformedBody, "request body must be a JSON object");

  bool bad_side = false, bad_type = false, bad_price = false, bad_qty = false, bad_account = false;

  OrderFields f{};
  f.side       = json_field(j, "side", bad_side);
  f.type       = json_field(j, "type", bad_type);
  f.price      = json_field(j, "price", bad_price);
  f.quantity   = json_field(j, "quantity", bad_qty);
  f.account_id = json_field(j, "account_id", bad_account);

  if (bad_side)    return reject(RejectReason::InvalidSide, "side must be a string, got " + *f.side);
  if (bad_type)    return reject(RejectReason::InvalidType, "type must be a string, got " + *f.type);
  if (bad_price)   return reject(RejectReason::InvalidNumber, "price must be an integer, got " + *f.price);
  if (bad_qty)     return reject(RejectReason::InvalidNumber, "quantity must be an integer, got " + *f.quantity);
  if (bad_account) return reject(RejectReason::EmptyAccount, "account_id must be a string, got " + *f.account_id);

  return from_fields(f, out);
}

Validation parse_limit(const Params& params, std::size_t def, std::size_t& out) {
  const auto s = param(params, "limit");
  if (!s) {
    out = def;
    return Validation{};
  }

  const auto v = parse_int(*s);
  if (!v) return reject(RejectReason::InvalidNumber, "limit must be an integer, got '" + *s + "'");
  if (*v < 0) return reject(RejectReason::InvalidNumber, "limit must not be negative");

  out = static_cast<std::size_t>(*v);
  return Validation{};
}

std::string json_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

std::string to_json(const Trade& t) {
  std::ostringstream oss;
  put_trade(oss, t);
  return oss.str();
}

std::string to_json(const std::vector<Trade>& trades) {
  std::ostringstream oss;
  oss << "[";
  for (std::size_t i = 0; i < trades.size(); ++i) {
    if (i) oss << ",";
    put_trade(oss, trades[i]);
  }
  oss << "]";
  return oss.str();
}

std::string to_json(const PlaceResult& r) {
  std::ostringstream oss;
  oss << "{";
  oss << "\"order_id\":" << r.order_id << ",";
  oss << "\"status\":\"" << to_string(r.status) << "\",";
  oss << "\"filled_quantity\":" << r.filled_qty << ",";
  oss << "\"remaining_quantity\":" << r.remaining_qty << ",";
  oss << "\"trades\":" << to_json(r.trades) << ",";
  oss << "\"message\":\"" << json_escape(r.message) << "\"";
  oss << "}";
  return oss.str();
}

std::string to_json(const MarketSnapshot& s) {
  std::ostringstream oss;
  oss << "{";
  oss << "\"yes_bids\":";
  put_entries(oss, s.yes_bids);
  oss << ",\"yes_asks\":";
  put_entries(oss, s.yes_asks);
  oss << ",\"no_bids\":";
  put_entries(oss, s.no_bids);
  oss << ",\"no_asks\":";
  put_entries(oss, s.no_asks);
  oss << "}";
  return oss.str();
}

std::string to_json(const Order& o) {
  std::ostringstream oss;
  oss << "{";
  oss << "\"order_id\":" << o.id << ",";
  oss << "\"account_id\":\"" << json_escape(o.account) << "\",";
  oss << "\"side\":\"" << to_string(o.side) << "\",";
  oss << "\"type\":\"" << to_string(o.type) << "\",";
  oss << "\"price\":" << o.original_price << ",";
  oss << "\"canonical_side\":\"" << to_string(o.canonical_side) << "\",";
  oss << "\"canonical_price\":" << o.price << ",";
  oss << "\"quantity\":" << o.qty << ",";
  oss << "\"timestamp\":";
  put_seconds(oss, o.ts);
  oss << "}";
  return oss.str();
}

std::string message_json(std::string_view message) {
  return "{\"message\":\"" + json_escape(message) + "\"}";
}

std::string error_json(std::string_view detail) {
  return "{\"detail\":\"" + json_escape(detail) + "\"}";
}

} // namespace pmx::api
