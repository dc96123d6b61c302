#include "rxpos/sale/sale_commit_protocol.hpp"
#include "rxpos/domain/money.hpp"
#include "rxpos/time/time_utils.hpp"

#include <cctype>
#include <iostream>
#include <utility>

namespace rxpos {

namespace {

std::optional<std::string> normalizedCustomer(
    const std::optional<std::string>& name) {
  if (!name) {
    return std::nullopt;
  }
  std::size_t begin = 0;
  std::size_t end = name->size();
  while (begin < end &&
         std::isspace(static_cast<unsigned char>((*name)[begin]))) {
    ++begin;
  }
  while (end > begin &&
         std::isspace(static_cast<unsigned char>((*name)[end - 1]))) {
    --end;
  }
  if (begin == end) {
    return std::nullopt;
  }
  return name->substr(begin, end - begin);
}

}  // namespace

const char* toString(CommitState state) {
  switch (state) {
    case CommitState::Idle:           return "Idle";
    case CommitState::Validating:     return "Validating";
    case CommitState::Persisting:     return "Persisting";
    case CommitState::AdjustingStock: return "AdjustingStock";
    case CommitState::Done:           return "Done";
    case CommitState::Failed:         return "Failed";
  }
  return "Unknown";
}

SaleCommitProtocol::SaleCommitProtocol(ISaleStore& store, IMedicineStock& stock,
                                       const ITimeProvider& clock,
                                       EventBus* bus, IMedicineLookup* lookup,
                                       int low_stock_threshold)
    : store_(store),
      stock_(stock),
      clock_(clock),
      bus_(bus),
      lookup_(lookup),
      low_stock_threshold_(low_stock_threshold) {}

// -----------------------------------------------------------------------------
// complete(): steps 1-3 on a snapshot, then step 4 on the live cart
// -----------------------------------------------------------------------------
Result<domain::SaleRecord> SaleCommitProtocol::complete(
    CartEngine& cart, std::optional<domain::CashierId> cashier_id,
    std::optional<std::string> customer_name) {
  std::lock_guard lock(commit_mutex_);

  auto result = commitLocked(cart.snapshot(), cashier_id,
                             std::move(customer_name));
  if (!result.ok()) {
    // Includes StockAdjustmentFailed: the cart is kept for reconciliation.
    return result;
  }

  cart.clear();

  if (bus_ != nullptr) {
    bus_->publish(SaleCompletedEvent{*result.value});
  }
  notifyLowStock(*result.value);

  return result;
}

// -----------------------------------------------------------------------------
// commit(): steps 1-3 only
// -----------------------------------------------------------------------------
Result<domain::SaleRecord> SaleCommitProtocol::commit(
    const domain::Cart& cart, std::optional<domain::CashierId> cashier_id,
    std::optional<std::string> customer_name) {
  std::lock_guard lock(commit_mutex_);
  return commitLocked(cart, cashier_id, std::move(customer_name));
}

Result<domain::SaleRecord> SaleCommitProtocol::commitLocked(
    const domain::Cart& cart, std::optional<domain::CashierId> cashier_id,
    std::optional<std::string> customer_name) {
  using R = Result<domain::SaleRecord>;

  // ---  1) Validating -------------------------------------------------------
  state_.store(CommitState::Validating);

  if (cart.empty()) {
    return fail(PosError::emptyCart());
  }

  domain::CartTotals totals = domain::computeTotals(cart);
  std::int64_t now = clock_.now_ms();

  domain::SaleRecord candidate;
  candidate.date = isoDateFromMs(now);
  candidate.created_at = isoDateTimeFromMs(now);
  candidate.items = cart.lines;
  candidate.subtotal = totals.subtotal;
  candidate.discount = totals.discount;
  candidate.tax = totals.tax;
  candidate.total = totals.total;
  candidate.payment_method = cart.payment_method;
  candidate.cashier_id = cashier_id;
  candidate.customer_name = normalizedCustomer(customer_name);

  auto errors = candidate.validate();
  if (!errors.empty()) {
    return fail(PosError::validationFailed(std::move(errors)));
  }

  // ---  2) Persisting -------------------------------------------------------
  state_.store(CommitState::Persisting);

  auto saved = store_.save(candidate);
  if (!saved.ok()) {
    std::cerr << "[SaleCommit] Sale not recorded: " << saved.error->message
              << "\n";
    return fail(*saved.error);
  }
  domain::SaleRecord sale = std::move(*saved.value);

  // ---  3) AdjustingStock ---------------------------------------------------
  state_.store(CommitState::AdjustingStock);

  for (const auto& line : sale.items) {
    auto decremented = stock_.checkAndDecrement(line.medicine_id, line.quantity);
    if (decremented.ok() && *decremented.value) {
      continue;
    }

    std::string detail =
        decremented.ok()
            ? "insufficient stock for " + std::to_string(line.quantity) +
                  " units at commit time"
            : decremented.error->message;

    PosError alarm =
        PosError::stockAdjustmentFailed(sale.id, line.medicine_id, detail);

    std::cerr << "[StockAlert] " << alarm.message << "\n";

    if (bus_ != nullptr) {
      bus_->publish(StockAlertEvent{sale.id, line.medicine_id, line.name,
                                    line.quantity, detail});
    }

    state_.store(CommitState::Failed);
    return R::partial(std::move(sale), std::move(alarm));
  }

  state_.store(CommitState::Done);

  std::cout << "[SaleCommit] Sale " << sale.id << " completed: "
            << sale.items.size() << " line(s), total "
            << money::formatCurrency(sale.total) << " ("
            << domain::toString(sale.payment_method) << ")\n";

  return R::success(std::move(sale));
}

Result<domain::SaleRecord> SaleCommitProtocol::fail(PosError error) {
  state_.store(CommitState::Failed);
  return Result<domain::SaleRecord>::failure(std::move(error));
}

// -----------------------------------------------------------------------------
// notifyLowStock(): one LowStockEvent per sold medicine at/below threshold
// -----------------------------------------------------------------------------
void SaleCommitProtocol::notifyLowStock(const domain::SaleRecord& sale) {
  if (lookup_ == nullptr || bus_ == nullptr) {
    return;
  }

  int threshold = low_stock_threshold_.load();
  for (const auto& line : sale.items) {
    auto current = lookup_->findById(line.medicine_id);
    if (!current.ok()) {
      // Deleted since the sale, or a read failure; nothing to report on.
      continue;
    }
    if (current.value->isLowStock(threshold)) {
      std::cout << "[SaleCommit] Low stock: " << current.value->name << " ("
                << current.value->quantity << " left)\n";
      bus_->publish(LowStockEvent{current.value->id, current.value->name,
                                  current.value->quantity, threshold});
    }
  }
}

}  // namespace rxpos
