#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rxpos {
namespace domain {

// -----------------------------------------------------------------------------
// MedicineId
// -----------------------------------------------------------------------------
// Row id of a medicine. Assigned by the medicine repository on insert and
// never changed afterwards. 0 is the "not yet persisted" sentinel.
// -----------------------------------------------------------------------------
using MedicineId = std::int64_t;

// -----------------------------------------------------------------------------
// MedicineRecord
// -----------------------------------------------------------------------------
//
// @brief  One stock-keeping unit in the pharmacy: descriptive fields, the
//         on-hand quantity, and its two prices.
//
// @details
// quantity is the only field a sale touches, and only through the
// repository's conditional decrement (quantity never goes below 0).
// Everything else changes through inventory add/edit.
//
// selling_price is copied into a CartLine when the medicine is added to a
// cart. Later edits to the record do not reprice lines already in a cart.
//
// Dates are ISO strings (YYYY-MM-DD) so that lexical comparison is date
// comparison; the repository relies on this for its expiry queries.
//
// Value type: copied freely between the repository, the cart, and events.
// -----------------------------------------------------------------------------
struct MedicineRecord {
  MedicineId id{0};
  std::string name;
  std::string category;
  std::string batch_no;
  std::string expiry_date;           // YYYY-MM-DD
  int quantity{0};                   // On-hand units, >= 0
  double purchase_price{0.0};
  double selling_price{0.0};
  std::optional<std::string> barcode;
  std::string created_at;
  std::string updated_at;

  // ---------------------------------------------------------------------------
  // validate(today)
  // ---------------------------------------------------------------------------
  // @brief  Field-level checks applied before an inventory add or edit.
  //
  // @param  today  Current date as YYYY-MM-DD; expiry must be after it.
  //
  // @return Human-readable error messages; empty when the record is valid.
  //
  // @details
  // Rules: name 2..100 chars, category and batch_no required (<= 50 chars),
  // expiry_date well-formed and in the future, quantity 0..999999, both
  // prices 0..999999.99, selling_price not below purchase_price when both
  // are set, barcode (if present) 8..20 alphanumerics.
  // ---------------------------------------------------------------------------
  std::vector<std::string> validate(const std::string& today) const;

  bool canSell(int requested) const { return requested > 0 && quantity >= requested; }
  bool isLowStock(int threshold) const { return quantity <= threshold; }

  // Expired when expiry_date <= today. A malformed date counts as expired.
  bool isExpired(const std::string& today) const;
};

}  // namespace domain
}  // namespace rxpos
