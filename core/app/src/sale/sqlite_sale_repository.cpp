#include "rxpos/sale/sqlite_sale_repository.hpp"
#include "rxpos/domain/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace rxpos {

namespace {

constexpr const char* kColumns =
    "SELECT id, date, items, subtotal, discount, tax, total, payment_method, "
    "cashier_id, customer_name, created_at FROM sales ";

constexpr const char* kNewestFirst =
    " ORDER BY date DESC, created_at DESC, id DESC";

domain::SaleRecord readRow(const storage::Statement& st) {
  domain::SaleRecord s;
  s.id = st.columnInt64(0);
  s.date = st.columnText(1);

  try {
    s.items = nlohmann::json::parse(st.columnText(2))
                  .get<std::vector<domain::CartLine>>();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[SaleRepository] sale " << s.id
              << " has unreadable items: " << e.what() << "\n";
    s.items.clear();
  }

  s.subtotal = st.columnDouble(3);
  s.discount = st.columnDouble(4);
  s.tax = st.columnDouble(5);
  s.total = st.columnDouble(6);

  std::string method = st.columnText(7);
  if (auto parsed = domain::parsePaymentMethod(method)) {
    s.payment_method = *parsed;
  } else {
    std::cerr << "[SaleRepository] sale " << s.id
              << " has unknown payment method '" << method << "'\n";
  }

  s.cashier_id = st.columnOptionalInt64(8);
  s.customer_name = st.columnOptionalText(9);
  s.created_at = st.columnText(10);
  return s;
}

}  // namespace

SqliteSaleRepository::SqliteSaleRepository(storage::Database& db) : db_(db) {}

// -----------------------------------------------------------------------------
// save(): single INSERT, id from last_insert_rowid
// -----------------------------------------------------------------------------
Result<domain::SaleRecord> SqliteSaleRepository::save(
    const domain::SaleRecord& sale) {
  using R = Result<domain::SaleRecord>;

  domain::SaleRecord stored = sale;
  try {
    std::string items = nlohmann::json(sale.items).dump();

    std::lock_guard lock(db_.mutex());

    storage::Statement st(
        db_,
        "INSERT INTO sales (date, items, subtotal, discount, tax, total, "
        "payment_method, cashier_id, customer_name, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    st.bind(1, sale.date);
    st.bind(2, items);
    st.bind(3, sale.subtotal);
    st.bind(4, sale.discount);
    st.bind(5, sale.tax);
    st.bind(6, sale.total);
    st.bind(7, std::string(domain::toString(sale.payment_method)));
    st.bind(8, sale.cashier_id);
    st.bind(9, sale.customer_name);
    st.bind(10, sale.created_at);
    st.step();

    stored.id = db_.lastInsertRowId();
  } catch (const storage::StorageError& e) {
    std::cerr << "[SaleRepository] save failed: " << e.what() << "\n";
    return R::failure(PosError::persistFailed(e.what()));
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[SaleRepository] could not encode items: " << e.what()
              << "\n";
    return R::failure(PosError::persistFailed(e.what()));
  }

  return R::success(std::move(stored));
}

// -----------------------------------------------------------------------------
// findById()
// -----------------------------------------------------------------------------
Result<domain::SaleRecord> SqliteSaleRepository::findById(domain::SaleId id) {
  using R = Result<domain::SaleRecord>;

  auto rows = query(
      "WHERE id = ?", [id](storage::Statement& st) { st.bind(1, id); },
      "findById");
  if (!rows.ok()) {
    return R::failure(*rows.error);
  }
  if (rows.value->empty()) {
    PosError e;
    e.kind = ErrorKind::NotFound;
    e.sale_id = id;
    e.message = "Sale with ID " + std::to_string(id) + " not found";
    return R::failure(std::move(e));
  }
  return R::success(std::move(rows.value->front()));
}

// -----------------------------------------------------------------------------
// List queries
// -----------------------------------------------------------------------------
Result<std::vector<domain::SaleRecord>> SqliteSaleRepository::listByDateRange(
    const std::string& start_date, const std::string& end_date) {
  return query(
      std::string("WHERE date >= ? AND date <= ?") + kNewestFirst,
      [&](storage::Statement& st) {
        st.bind(1, start_date);
        st.bind(2, end_date);
      },
      "listByDateRange");
}

Result<std::vector<domain::SaleRecord>> SqliteSaleRepository::listRecent(
    std::size_t limit) {
  auto n = static_cast<std::int64_t>(limit);
  return query(
      "ORDER BY created_at DESC, id DESC LIMIT ?",
      [n](storage::Statement& st) { st.bind(1, n); }, "listRecent");
}

Result<std::vector<domain::SaleRecord>> SqliteSaleRepository::listByCashier(
    domain::CashierId cashier_id) {
  return query(
      std::string("WHERE cashier_id = ?") + kNewestFirst,
      [cashier_id](storage::Statement& st) { st.bind(1, cashier_id); },
      "listByCashier");
}

Result<double> SqliteSaleRepository::totalRevenue(
    const std::optional<std::string>& start_date,
    const std::optional<std::string>& end_date) {
  bool ranged = start_date.has_value() && end_date.has_value();

  double total = 0.0;
  try {
    std::lock_guard lock(db_.mutex());

    storage::Statement st(
        db_, ranged ? "SELECT COALESCE(SUM(total), 0) FROM sales "
                      "WHERE date >= ? AND date <= ?"
                    : "SELECT COALESCE(SUM(total), 0) FROM sales");
    if (ranged) {
      st.bind(1, *start_date);
      st.bind(2, *end_date);
    }
    if (st.step()) {
      total = st.columnDouble(0);
    }
  } catch (const storage::StorageError& e) {
    std::cerr << "[SaleRepository] totalRevenue failed: " << e.what() << "\n";
    return Result<double>::failure(PosError::persistFailed(e.what()));
  }
  return Result<double>::success(total);
}

// -----------------------------------------------------------------------------
// query(): shared SELECT runner
// -----------------------------------------------------------------------------
template <typename Binder>
Result<std::vector<domain::SaleRecord>> SqliteSaleRepository::query(
    const std::string& tail, Binder bind_params, const char* what) {
  using R = Result<std::vector<domain::SaleRecord>>;

  std::vector<domain::SaleRecord> rows;
  try {
    std::lock_guard lock(db_.mutex());

    storage::Statement st(db_, std::string(kColumns) + tail);
    bind_params(st);
    while (st.step()) {
      rows.push_back(readRow(st));
    }
  } catch (const storage::StorageError& e) {
    std::cerr << "[SaleRepository] " << what << " failed: " << e.what()
              << "\n";
    return R::failure(PosError::persistFailed(e.what()));
  }
  return R::success(std::move(rows));
}

}  // namespace rxpos
