#include "pmx/validation.hpp"

namespace pmx {

std::string_view to_string(RejectReason r) noexcept {
  switch (r) {
    case RejectReason::None:            return "None";
    case RejectReason::MalformedBody:   return "MalformedBody";
    case RejectReason::MissingField:    return "MissingField";
    case RejectReason::InvalidSide:     return "InvalidSide";
    case RejectReason::InvalidType:     return "InvalidType";
    case RejectReason::InvalidNumber:   return "InvalidNumber";
    case RejectReason::PriceOutOfRange: return "PriceOutOfRange";
    case RejectReason::QtyBelowMinimum: return "QtyBelowMinimum";
    case RejectReason::EmptyAccount:    return "EmptyAccount";
  }
  return "Unknown";
}

Validation validate(const OrderRequest& req, const ValidationConfig& cfg) {
  Validation v{};

  if (req.price < cfg.min_price || req.price > cfg.max_price) {
    v.reason = RejectReason::PriceOutOfRange;
    v.detail = "price must be between " + std::to_string(cfg.min_price) + " and " +
               std::to_string(cfg.max_price) + ", got " + std::to_string(req.price);
    return v;
  }

  if (req.qty < cfg.min_qty) {
    v.reason = RejectReason::QtyBelowMinimum;
    v.detail = "quantity must be at least " + std::to_string(cfg.min_qty) + ", got " +
               std::to_string(req.qty);
    return v;
  }

  if (req.account.empty()) {
    v.reason = RejectReason::EmptyAccount;
    v.detail = "account_id must not be empty";
    return v;
  }

  return v;
}

} // namespace pmx
