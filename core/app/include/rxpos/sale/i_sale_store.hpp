#pragma once

#include "rxpos/domain/errors.hpp"
#include "rxpos/domain/sale_record.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rxpos {

// -----------------------------------------------------------------------------
// ISaleStore: append-only sale storage
// -----------------------------------------------------------------------------
//
// @brief  Durable home of committed SaleRecords.
//
// @details
// save() is the only write. Records are never updated afterwards; the store
// assigns the id and returns the record as persisted.
//
// Date arguments are ISO "YYYY-MM-DD" strings; ranges are inclusive at both
// ends. Every list is ordered newest first (date, then created_at, then id,
// all descending).
//
// Errors: PersistFailed on storage failure; findById returns NotFound for an
// unknown id. Implementations must not throw.
//
// Thread-safety: Implementations are safe to call from any thread.
// -----------------------------------------------------------------------------
class ISaleStore {
 public:
  virtual ~ISaleStore() = default;

  // Persists `sale` (its id is ignored) and returns it with the new id.
  virtual Result<domain::SaleRecord> save(const domain::SaleRecord& sale) = 0;

  virtual Result<domain::SaleRecord> findById(domain::SaleId id) = 0;

  virtual Result<std::vector<domain::SaleRecord>> listByDateRange(
      const std::string& start_date, const std::string& end_date) = 0;

  // The `limit` most recently created sales.
  virtual Result<std::vector<domain::SaleRecord>> listRecent(
      std::size_t limit) = 0;

  virtual Result<std::vector<domain::SaleRecord>> listByCashier(
      domain::CashierId cashier_id) = 0;

  // Sum of `total` over all sales, or over [start, end] when both are given.
  virtual Result<double> totalRevenue(
      const std::optional<std::string>& start_date,
      const std::optional<std::string>& end_date) = 0;
};

}  // namespace rxpos
