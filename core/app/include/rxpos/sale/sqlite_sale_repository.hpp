#pragma once

#include "rxpos/sale/i_sale_store.hpp"
#include "rxpos/storage/database.hpp"

namespace rxpos {

// -----------------------------------------------------------------------------
// SqliteSaleRepository: sales table
// -----------------------------------------------------------------------------
//
// @brief  ISaleStore over the shared SQLite connection.
//
// @details
// `items` is stored as a JSON array of line objects (medicine_id, name,
// quantity, unit_price, total_price, batch_no). A row whose items column no
// longer parses is still returned, with an empty item list and a warning on
// std::cerr, so that one damaged row cannot hide a whole day's sales.
//
// Thread-safety: Every public method holds Database::mutex() for its
// duration.
// -----------------------------------------------------------------------------
class SqliteSaleRepository final : public ISaleStore {
 public:
  explicit SqliteSaleRepository(storage::Database& db);

  SqliteSaleRepository(const SqliteSaleRepository&) = delete;
  SqliteSaleRepository& operator=(const SqliteSaleRepository&) = delete;

  Result<domain::SaleRecord> save(const domain::SaleRecord& sale) override;
  Result<domain::SaleRecord> findById(domain::SaleId id) override;
  Result<std::vector<domain::SaleRecord>> listByDateRange(
      const std::string& start_date, const std::string& end_date) override;
  Result<std::vector<domain::SaleRecord>> listRecent(
      std::size_t limit) override;
  Result<std::vector<domain::SaleRecord>> listByCashier(
      domain::CashierId cashier_id) override;
  Result<double> totalRevenue(
      const std::optional<std::string>& start_date,
      const std::optional<std::string>& end_date) override;

 private:
  template <typename Binder>
  Result<std::vector<domain::SaleRecord>> query(const std::string& tail,
                                                Binder bind_params,
                                                const char* what);

  storage::Database& db_;
};

}  // namespace rxpos
