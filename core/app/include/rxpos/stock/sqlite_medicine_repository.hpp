#pragma once

#include "rxpos/domain/errors.hpp"
#include "rxpos/domain/medicine.hpp"
#include "rxpos/stock/i_medicine_stock.hpp"
#include "rxpos/storage/database.hpp"
#include "rxpos/time/i_time_provider.hpp"

#include <string>
#include <vector>

namespace rxpos {

// -----------------------------------------------------------------------------
// SqliteMedicineRepository: medicines table
// -----------------------------------------------------------------------------
//
// @brief  Durable medicine records: inventory CRUD, the stock queries the
//         till and back office need, and the atomic checkAndDecrement used by
//         sale completion.
//
// @details
// Every public operation takes Database::mutex() for its whole duration and
// converts StorageError into PosError::persistFailed(). Nothing here throws.
//
// "Today" (expiry validation, expired/expiring queries that default to the
// current date) and the created_at/updated_at stamps come from the injected
// ITimeProvider.
//
// checkAndDecrement is a single conditional UPDATE. SQLite executes the
// statement atomically, so two connections racing on the same row cannot
// both pass the `quantity >= ?` test against the same stock.
//
// Thread-safety: All public methods are safe from any thread.
//
// Ownership:
//   Borrows the Database and the clock; both must outlive the repository.
// -----------------------------------------------------------------------------
class SqliteMedicineRepository final : public IMedicineLookup,
                                       public IMedicineStock {
 public:
  SqliteMedicineRepository(storage::Database& db, const ITimeProvider& clock);

  SqliteMedicineRepository(const SqliteMedicineRepository&) = delete;
  SqliteMedicineRepository& operator=(const SqliteMedicineRepository&) = delete;

  // -------------------------------------------------------------------------
  // add(medicine)
  // -------------------------------------------------------------------------
  // @brief  Validates and inserts a new medicine.
  //
  // @return The stored record with its assigned id and timestamps.
  //
  // @details
  // ValidationFailed if MedicineRecord::validate() reports anything or the
  // barcode is already used by another medicine. The incoming id is ignored.
  // -------------------------------------------------------------------------
  Result<domain::MedicineRecord> add(domain::MedicineRecord medicine);

  // Rewrites every editable field of an existing medicine (validated as in
  // add()). NotFound if the id does not exist.
  Status update(const domain::MedicineRecord& medicine);

  // NotFound if the id does not exist.
  Status remove(domain::MedicineId id);

  Result<domain::MedicineRecord> findById(domain::MedicineId id) override;
  Result<domain::MedicineRecord> findByBarcode(const std::string& barcode);

  // All medicines ordered by name.
  Result<std::vector<domain::MedicineRecord>> findAll();

  // Case-insensitive substring match on name, category, batch number, or
  // barcode, ordered by name. An empty query returns findAll().
  Result<std::vector<domain::MedicineRecord>> search(const std::string& query);

  // quantity <= threshold, lowest stock first.
  Result<std::vector<domain::MedicineRecord>> lowStock(int threshold);

  // expiry_date <= today, earliest first.
  Result<std::vector<domain::MedicineRecord>> expired(const std::string& today);

  // today < expiry_date <= today + days, earliest first.
  Result<std::vector<domain::MedicineRecord>> expiringSoon(
      const std::string& today, int days);

  Result<bool> checkAndDecrement(domain::MedicineId id, int quantity) override;

 private:
  // Runs a SELECT over all medicine columns with one optional text/int
  // parameter binder. Caller must NOT hold the mutex.
  template <typename Binder>
  Result<std::vector<domain::MedicineRecord>> query(const std::string& where,
                                                    Binder bind_params,
                                                    const char* what);

  // Field-level and barcode-uniqueness checks. Caller holds the mutex.
  std::vector<std::string> validateLocked(
      const domain::MedicineRecord& medicine);

  std::string today() const;
  std::string nowStamp() const;

  storage::Database& db_;
  const ITimeProvider& clock_;
};

}  // namespace rxpos
