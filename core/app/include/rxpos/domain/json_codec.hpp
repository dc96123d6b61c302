#pragma once

#include "rxpos/domain/cart.hpp"
#include "rxpos/domain/medicine.hpp"
#include "rxpos/domain/sale_record.hpp"

#include <nlohmann/json.hpp>

namespace rxpos {
namespace domain {

// -----------------------------------------------------------------------------
// JSON conversions (nlohmann ADL hooks)
// -----------------------------------------------------------------------------
// Used in two places with the same field names:
//   - the sales.items column (array of CartLine objects)
//   - IPC command responses and telemetry
//
// Payment methods travel as their lower-case token ("bank_transfer").
// Optional fields are written as JSON null when absent.
// from_json(CartLine) throws nlohmann::json::exception on a missing or
// mistyped key; batch_no alone may be absent or null.
// -----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const CartLine& line);
void from_json(const nlohmann::json& j, CartLine& line);

void to_json(nlohmann::json& j, const CartTotals& totals);
void to_json(nlohmann::json& j, const CartSummary& summary);
void to_json(nlohmann::json& j, const MedicineRecord& medicine);
void to_json(nlohmann::json& j, const SaleRecord& sale);

}  // namespace domain
}  // namespace rxpos
