#pragma once

#include "rxpos/domain/errors.hpp"
#include "rxpos/domain/medicine.hpp"

namespace rxpos {

// -----------------------------------------------------------------------------
// IMedicineLookup
// -----------------------------------------------------------------------------
// Responsibility: Read a single medicine's current record. Used by the
// session to fetch a fresh stock snapshot before each cart mutation, and by
// the commit protocol to report remaining stock after a sale.
//
// findById returns NotFound for an unknown id and PersistFailed on storage
// failure.
// -----------------------------------------------------------------------------
class IMedicineLookup {
 public:
  virtual ~IMedicineLookup() = default;

  virtual Result<domain::MedicineRecord> findById(domain::MedicineId id) = 0;
};

// -----------------------------------------------------------------------------
// IMedicineStock
// -----------------------------------------------------------------------------
//
// @brief  The one write a sale makes to inventory.
//
// @details
// checkAndDecrement(id, quantity) atomically tests and decrements on-hand
// stock:
//
//   value true   → quantity was >= requested and has been reduced by it
//   value false  → stock insufficient at the instant of the decrement, or no
//                  such medicine. Not an error; nothing was changed.
//   error        → PersistFailed: the outcome is unknown to the caller
//
// Implementations MUST make the test and the decrement indivisible, so that
// concurrent callers can never drive quantity below zero. A read followed by
// a separate write does not qualify.
//
// Thread-safety: Implementations are safe to call from any thread.
// -----------------------------------------------------------------------------
class IMedicineStock {
 public:
  virtual ~IMedicineStock() = default;

  virtual Result<bool> checkAndDecrement(domain::MedicineId id,
                                         int quantity) = 0;
};

}  // namespace rxpos
