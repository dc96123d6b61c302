#pragma once

#include "rxpos/domain/cart.hpp"
#include "rxpos/domain/payment_method.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rxpos {
namespace domain {

// Row id of a committed sale, assigned by the sale store. 0 = unpersisted.
using SaleId = std::int64_t;

// Id of the cashier (user) who rang up the sale.
using CashierId = std::int64_t;

// -----------------------------------------------------------------------------
// SaleRecord
// -----------------------------------------------------------------------------
//
// @brief  Immutable record of a completed transaction.
//
// @details
// Built only by SaleCommitProtocol from a Cart snapshot, written once to the
// sale store, never updated. `items` is a copy of the cart lines at commit
// time; later cart activity cannot reach it.
//
// Monetary fields come from computeTotals() and therefore satisfy
//   total == round2(round2(subtotal - discount) + tax)
//
// created_at is the audit timestamp ("YYYY-MM-DDTHH:MM:SS"); date is the
// business day ("YYYY-MM-DD") used for range queries.
// -----------------------------------------------------------------------------
struct SaleRecord {
  SaleId id{0};
  std::string date;
  std::vector<CartLine> items;
  double subtotal{0.0};
  double discount{0.0};
  double tax{0.0};
  double total{0.0};
  PaymentMethod payment_method{PaymentMethod::Cash};
  std::optional<CashierId> cashier_id;
  std::optional<std::string> customer_name;
  std::string created_at;

  // ---------------------------------------------------------------------------
  // validate()
  // ---------------------------------------------------------------------------
  // @brief  Pre-persist checks on a candidate record.
  //
  // @return Error messages; empty when valid.
  //
  // @details
  // date present and YYYY-MM-DD; at least one item; subtotal, discount, tax,
  // and total each >= 0. payment_method is an enum and is valid by
  // construction.
  // ---------------------------------------------------------------------------
  std::vector<std::string> validate() const;

  // Total units across all items.
  int totalQuantity() const;
};

}  // namespace domain
}  // namespace rxpos
