#include "rxpos/stock/sqlite_medicine_repository.hpp"
#include "rxpos/time/time_utils.hpp"

#include <iostream>
#include <utility>

namespace rxpos {

namespace {

constexpr const char* kColumns =
    "SELECT id, name, category, batch_no, expiry_date, quantity, "
    "purchase_price, selling_price, barcode, created_at, updated_at "
    "FROM medicines ";

domain::MedicineRecord readRow(const storage::Statement& st) {
  domain::MedicineRecord m;
  m.id = st.columnInt64(0);
  m.name = st.columnText(1);
  m.category = st.columnText(2);
  m.batch_no = st.columnText(3);
  m.expiry_date = st.columnText(4);
  m.quantity = st.columnInt(5);
  m.purchase_price = st.columnDouble(6);
  m.selling_price = st.columnDouble(7);
  m.barcode = st.columnOptionalText(8);
  m.created_at = st.columnText(9);
  m.updated_at = st.columnText(10);
  return m;
}

// Barcodes are stored trimmed; blank ones are stored as NULL so that the
// UNIQUE constraint only applies to real codes.
std::optional<std::string> normalizedBarcode(
    const std::optional<std::string>& barcode) {
  if (!barcode) {
    return std::nullopt;
  }
  constexpr const char* kSpace = " \t\n\r\f\v";
  std::size_t begin = barcode->find_first_not_of(kSpace);
  if (begin == std::string::npos) {
    return std::nullopt;
  }
  std::size_t end = barcode->find_last_not_of(kSpace);
  return barcode->substr(begin, end - begin + 1);
}

}  // namespace

SqliteMedicineRepository::SqliteMedicineRepository(storage::Database& db,
                                                   const ITimeProvider& clock)
    : db_(db), clock_(clock) {}

std::string SqliteMedicineRepository::today() const {
  return isoDateFromMs(clock_.now_ms());
}

std::string SqliteMedicineRepository::nowStamp() const {
  return isoDateTimeFromMs(clock_.now_ms());
}

// -----------------------------------------------------------------------------
// validateLocked(): field rules plus barcode uniqueness
// -----------------------------------------------------------------------------
std::vector<std::string> SqliteMedicineRepository::validateLocked(
    const domain::MedicineRecord& medicine) {
  std::vector<std::string> errors = medicine.validate(today());

  auto barcode = normalizedBarcode(medicine.barcode);
  if (barcode) {
    storage::Statement st(
        db_, "SELECT id FROM medicines WHERE barcode = ? AND id != ?");
    st.bind(1, *barcode);
    st.bind(2, medicine.id);
    if (st.step()) {
      errors.push_back("Barcode " + *barcode +
                       " is already assigned to another medicine");
    }
  }
  return errors;
}

// -----------------------------------------------------------------------------
// add()
// -----------------------------------------------------------------------------
Result<domain::MedicineRecord> SqliteMedicineRepository::add(
    domain::MedicineRecord medicine) {
  using R = Result<domain::MedicineRecord>;

  try {
    std::lock_guard lock(db_.mutex());

    medicine.id = 0;
    auto errors = validateLocked(medicine);
    if (!errors.empty()) {
      return R::failure(PosError::validationFailed(std::move(errors)));
    }

    medicine.barcode = normalizedBarcode(medicine.barcode);
    medicine.created_at = nowStamp();
    medicine.updated_at = medicine.created_at;

    storage::Statement st(
        db_,
        "INSERT INTO medicines (name, category, batch_no, expiry_date, "
        "quantity, purchase_price, selling_price, barcode, created_at, "
        "updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    st.bind(1, medicine.name);
    st.bind(2, medicine.category);
    st.bind(3, medicine.batch_no);
    st.bind(4, medicine.expiry_date);
    st.bind(5, medicine.quantity);
    st.bind(6, medicine.purchase_price);
    st.bind(7, medicine.selling_price);
    st.bind(8, medicine.barcode);
    st.bind(9, medicine.created_at);
    st.bind(10, medicine.updated_at);
    st.step();

    medicine.id = db_.lastInsertRowId();
  } catch (const storage::StorageError& e) {
    std::cerr << "[MedicineRepository] add failed: " << e.what() << "\n";
    return R::failure(PosError::persistFailed(e.what()));
  }

  std::cout << "[MedicineRepository] Added medicine " << medicine.id << " ("
            << medicine.name << ", qty=" << medicine.quantity << ")\n";
  return R::success(std::move(medicine));
}

// -----------------------------------------------------------------------------
// update()
// -----------------------------------------------------------------------------
Status SqliteMedicineRepository::update(const domain::MedicineRecord& medicine) {
  try {
    std::lock_guard lock(db_.mutex());

    auto errors = validateLocked(medicine);
    if (!errors.empty()) {
      return PosError::validationFailed(std::move(errors));
    }

    storage::Statement st(
        db_,
        "UPDATE medicines SET name = ?, category = ?, batch_no = ?, "
        "expiry_date = ?, quantity = ?, purchase_price = ?, "
        "selling_price = ?, barcode = ?, updated_at = ? WHERE id = ?");
    st.bind(1, medicine.name);
    st.bind(2, medicine.category);
    st.bind(3, medicine.batch_no);
    st.bind(4, medicine.expiry_date);
    st.bind(5, medicine.quantity);
    st.bind(6, medicine.purchase_price);
    st.bind(7, medicine.selling_price);
    st.bind(8, normalizedBarcode(medicine.barcode));
    st.bind(9, nowStamp());
    st.bind(10, medicine.id);
    st.step();

    if (db_.changes() == 0) {
      return PosError::medicineNotFound(medicine.id);
    }
  } catch (const storage::StorageError& e) {
    std::cerr << "[MedicineRepository] update failed: " << e.what() << "\n";
    return PosError::persistFailed(e.what());
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// remove()
// -----------------------------------------------------------------------------
Status SqliteMedicineRepository::remove(domain::MedicineId id) {
  try {
    std::lock_guard lock(db_.mutex());

    storage::Statement st(db_, "DELETE FROM medicines WHERE id = ?");
    st.bind(1, id);
    st.step();

    if (db_.changes() == 0) {
      return PosError::medicineNotFound(id);
    }
  } catch (const storage::StorageError& e) {
    std::cerr << "[MedicineRepository] remove failed: " << e.what() << "\n";
    return PosError::persistFailed(e.what());
  }

  std::cout << "[MedicineRepository] Removed medicine " << id << "\n";
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Single-row lookups
// -----------------------------------------------------------------------------
Result<domain::MedicineRecord> SqliteMedicineRepository::findById(
    domain::MedicineId id) {
  using R = Result<domain::MedicineRecord>;

  auto rows = query(
      "WHERE id = ?", [id](storage::Statement& st) { st.bind(1, id); },
      "findById");
  if (!rows.ok()) {
    return R::failure(*rows.error);
  }
  if (rows.value->empty()) {
    return R::failure(PosError::medicineNotFound(id));
  }
  return R::success(std::move(rows.value->front()));
}

Result<domain::MedicineRecord> SqliteMedicineRepository::findByBarcode(
    const std::string& barcode) {
  using R = Result<domain::MedicineRecord>;

  const std::string code = normalizedBarcode(barcode).value_or("");
  auto rows = query(
      "WHERE barcode = ?",
      [&code](storage::Statement& st) { st.bind(1, code); },
      "findByBarcode");
  if (!rows.ok()) {
    return R::failure(*rows.error);
  }
  if (rows.value->empty()) {
    PosError e;
    e.kind = ErrorKind::NotFound;
    e.message = "Medicine with barcode " + barcode + " not found";
    return R::failure(std::move(e));
  }
  return R::success(std::move(rows.value->front()));
}

// -----------------------------------------------------------------------------
// List queries
// -----------------------------------------------------------------------------
Result<std::vector<domain::MedicineRecord>> SqliteMedicineRepository::findAll() {
  return query("ORDER BY name ASC", [](storage::Statement&) {}, "findAll");
}

Result<std::vector<domain::MedicineRecord>> SqliteMedicineRepository::search(
    const std::string& query_text) {
  if (query_text.empty()) {
    return findAll();
  }

  std::string pattern = "%" + query_text + "%";
  return query(
      "WHERE name LIKE ?1 OR category LIKE ?1 OR batch_no LIKE ?1 "
      "OR barcode LIKE ?1 ORDER BY name ASC",
      [&pattern](storage::Statement& st) { st.bind(1, pattern); }, "search");
}

Result<std::vector<domain::MedicineRecord>> SqliteMedicineRepository::lowStock(
    int threshold) {
  return query(
      "WHERE quantity <= ? ORDER BY quantity ASC, name ASC",
      [threshold](storage::Statement& st) { st.bind(1, threshold); },
      "lowStock");
}

Result<std::vector<domain::MedicineRecord>> SqliteMedicineRepository::expired(
    const std::string& today_iso) {
  return query(
      "WHERE expiry_date <= ? ORDER BY expiry_date ASC, name ASC",
      [&today_iso](storage::Statement& st) { st.bind(1, today_iso); },
      "expired");
}

Result<std::vector<domain::MedicineRecord>>
SqliteMedicineRepository::expiringSoon(const std::string& today_iso,
                                       int days) {
  std::string horizon = addDays(today_iso, days);
  return query(
      "WHERE expiry_date > ? AND expiry_date <= ? "
      "ORDER BY expiry_date ASC, name ASC",
      [&today_iso, &horizon](storage::Statement& st) {
        st.bind(1, today_iso);
        st.bind(2, horizon);
      },
      "expiringSoon");
}

// -----------------------------------------------------------------------------
// checkAndDecrement(): one conditional UPDATE decides the outcome
// -----------------------------------------------------------------------------
Result<bool> SqliteMedicineRepository::checkAndDecrement(domain::MedicineId id,
                                                         int quantity) {
  if (quantity <= 0) {
    return Result<bool>::failure(PosError::invalidQuantity(quantity));
  }

  int affected = 0;
  try {
    std::lock_guard lock(db_.mutex());

    storage::Statement st(
        db_,
        "UPDATE medicines SET quantity = quantity - ?, updated_at = ? "
        "WHERE id = ? AND quantity >= ?");
    st.bind(1, quantity);
    st.bind(2, nowStamp());
    st.bind(3, id);
    st.bind(4, quantity);
    st.step();

    affected = db_.changes();
  } catch (const storage::StorageError& e) {
    std::cerr << "[MedicineRepository] checkAndDecrement(" << id << ", "
              << quantity << ") failed: " << e.what() << "\n";
    return Result<bool>::failure(PosError::persistFailed(e.what()));
  }

  if (affected == 0) {
    std::cerr << "[MedicineRepository] Stock decrement refused for medicine "
              << id << " (requested " << quantity << ")\n";
    return Result<bool>::success(false);
  }
  return Result<bool>::success(true);
}

// -----------------------------------------------------------------------------
// query(): shared SELECT runner
// -----------------------------------------------------------------------------
template <typename Binder>
Result<std::vector<domain::MedicineRecord>> SqliteMedicineRepository::query(
    const std::string& where, Binder bind_params, const char* what) {
  using R = Result<std::vector<domain::MedicineRecord>>;

  std::vector<domain::MedicineRecord> rows;
  try {
    std::lock_guard lock(db_.mutex());

    storage::Statement st(db_, std::string(kColumns) + where);
    bind_params(st);
    while (st.step()) {
      rows.push_back(readRow(st));
    }
  } catch (const storage::StorageError& e) {
    std::cerr << "[MedicineRepository] " << what << " failed: " << e.what()
              << "\n";
    return R::failure(PosError::persistFailed(e.what()));
  }
  return R::success(std::move(rows));
}

}  // namespace rxpos
