#pragma once

#include "rxpos/domain/medicine.hpp"
#include "rxpos/domain/sale_record.hpp"

#include <string>

namespace rxpos {

// -----------------------------------------------------------------------------
// SaleCompletedEvent
// -----------------------------------------------------------------------------
// Published by SaleCommitProtocol after a sale was persisted and every line's
// stock was decremented. Carries the record exactly as stored (id assigned).
// -----------------------------------------------------------------------------
struct SaleCompletedEvent {
  domain::SaleRecord sale;
};

// -----------------------------------------------------------------------------
// StockAlertEvent
// -----------------------------------------------------------------------------
// Data-consistency alarm. The sale `sale_id` is persisted, but the stock for
// `medicine_id` (and every line after it) was NOT decremented. Lines before
// it were. Requires operator reconciliation; nothing retries automatically.
//
// `reason` is the error message (refused decrement or storage failure).
// -----------------------------------------------------------------------------
struct StockAlertEvent {
  domain::SaleId sale_id{0};
  domain::MedicineId medicine_id{0};
  std::string medicine_name;
  int requested{0};
  std::string reason;
};

// -----------------------------------------------------------------------------
// LowStockEvent
// -----------------------------------------------------------------------------
// A medicine sold in a completed sale now has quantity <= threshold.
// -----------------------------------------------------------------------------
struct LowStockEvent {
  domain::MedicineId medicine_id{0};
  std::string name;
  int remaining{0};
  int threshold{0};
};

}  // namespace rxpos
