#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "pmx/order.hpp"
#include "pmx/types.hpp"

namespace pmx {

enum class RejectReason : uint8_t {
  None = 0,
  MalformedBody,
  MissingField,
  InvalidSide,
  InvalidType,
  InvalidNumber,
  PriceOutOfRange,
  QtyBelowMinimum,
  EmptyAccount
};

std::string_view to_string(RejectReason r) noexcept;

struct Validation {
  RejectReason reason{RejectReason::None};
  std::string detail{};

  bool ok() const noexcept { return reason == RejectReason::None; }
};

struct ValidationConfig {
  Price min_price{kMinPrice};
  Price max_price{kMaxPrice};
  Qty   min_qty{1};
};

// Single range check per field; the engine relies on these bounds.
Validation validate(const OrderRequest& req, const ValidationConfig& cfg = {});

} // namespace pmx
