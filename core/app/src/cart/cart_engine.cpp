#include "rxpos/cart/cart_engine.hpp"
#include "rxpos/domain/money.hpp"

#include <algorithm>
#include <limits>
#include <iostream>

namespace rxpos {

namespace {

double clampRate(double percent) {
  return std::clamp(percent, 0.0, 100.0);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
CartEngine::CartEngine(double default_tax_rate)
    : default_tax_rate_(clampRate(default_tax_rate)) {
  cart_.tax_rate_percent = default_tax_rate_;
}

// -----------------------------------------------------------------------------
// addItem: merge or append, validating against the caller's stock snapshot
// -----------------------------------------------------------------------------
Result<domain::CartLine> CartEngine::addItem(
    domain::MedicineId medicine_id, int requested_qty,
    const domain::MedicineRecord& current_stock) {
  using R = Result<domain::CartLine>;

  if (requested_qty <= 0) {
    return R::failure(PosError::invalidQuantity(requested_qty));
  }
  if (current_stock.id != medicine_id) {
    return R::failure(PosError::medicineNotFound(medicine_id));
  }

  std::lock_guard lock(mutex_);

  std::size_t idx = findLine(medicine_id);
  if (idx < cart_.lines.size()) {
    domain::CartLine& line = cart_.lines[idx];
    // Compared as headroom so the merged quantity is never formed unless it
    // fits in stock (and therefore in an int).
    if (requested_qty > current_stock.quantity - line.quantity) {
      constexpr int kMaxQty = std::numeric_limits<int>::max();
      int reported = requested_qty > kMaxQty - line.quantity
                         ? kMaxQty
                         : line.quantity + requested_qty;
      return R::failure(PosError::insufficientStock(
          medicine_id, current_stock.quantity, reported));
    }
    line.quantity += requested_qty;
    line.recompute();

    std::cout << "[CartEngine] Added " << requested_qty << " units of "
              << line.name << " (line qty=" << line.quantity << ")\n";
    return R::success(line);
  }

  if (current_stock.quantity < requested_qty) {
    return R::failure(PosError::insufficientStock(
        medicine_id, current_stock.quantity, requested_qty));
  }

  cart_.lines.push_back(domain::makeCartLine(current_stock, requested_qty));

  std::cout << "[CartEngine] Added " << requested_qty << " units of "
            << current_stock.name << " to cart\n";
  return R::success(cart_.lines.back());
}

// -----------------------------------------------------------------------------
// removeItem
// -----------------------------------------------------------------------------
Status CartEngine::removeItem(domain::MedicineId medicine_id) {
  std::lock_guard lock(mutex_);
  return removeItemLocked(medicine_id);
}

Status CartEngine::removeItemLocked(domain::MedicineId medicine_id) {
  std::size_t idx = findLine(medicine_id);
  if (idx >= cart_.lines.size()) {
    return PosError::lineNotFound(medicine_id);
  }

  std::cout << "[CartEngine] Removed " << cart_.lines[idx].name
            << " from cart\n";
  cart_.lines.erase(cart_.lines.begin() + static_cast<std::ptrdiff_t>(idx));
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// updateQuantity: non-positive quantity means remove
// -----------------------------------------------------------------------------
Status CartEngine::updateQuantity(domain::MedicineId medicine_id, int new_qty,
                                  const domain::MedicineRecord& current_stock) {
  std::lock_guard lock(mutex_);

  if (new_qty <= 0) {
    return removeItemLocked(medicine_id);
  }

  std::size_t idx = findLine(medicine_id);
  if (idx >= cart_.lines.size()) {
    return PosError::lineNotFound(medicine_id);
  }
  if (current_stock.id != medicine_id) {
    return PosError::medicineNotFound(medicine_id);
  }
  if (current_stock.quantity < new_qty) {
    return PosError::insufficientStock(medicine_id, current_stock.quantity,
                                       new_qty);
  }

  domain::CartLine& line = cart_.lines[idx];
  line.quantity = new_qty;
  line.recompute();
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// setDiscount
// -----------------------------------------------------------------------------
Status CartEngine::setDiscount(double amount) {
  // Negated so NaN is rejected as well; +inf fails the subtotal check.
  if (!(amount >= 0.0)) {
    return PosError::negativeValue("Discount");
  }

  std::lock_guard lock(mutex_);
  double subtotal = subtotalLocked();
  if (amount > subtotal) {
    return PosError::exceedsSubtotal(amount, subtotal);
  }
  cart_.discount = amount;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// setTaxRate
// -----------------------------------------------------------------------------
Status CartEngine::setTaxRate(double percent) {
  // Written as a negated range test so NaN is rejected too.
  if (!(percent >= 0.0 && percent <= 100.0)) {
    return PosError::taxRateOutOfRange(percent);
  }

  std::lock_guard lock(mutex_);
  cart_.tax_rate_percent = percent;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// setPaymentMethod
// -----------------------------------------------------------------------------
Status CartEngine::setPaymentMethod(domain::PaymentMethod method) {
  std::lock_guard lock(mutex_);
  cart_.payment_method = method;
  return std::nullopt;
}

Status CartEngine::setPaymentMethod(const std::string& token) {
  auto method = domain::parsePaymentMethod(token);
  if (!method) {
    return PosError::invalidPaymentMethod(token);
  }
  return setPaymentMethod(*method);
}

// -----------------------------------------------------------------------------
// Read-side accessors
// -----------------------------------------------------------------------------
domain::CartTotals CartEngine::totals() const {
  std::lock_guard lock(mutex_);
  return domain::computeTotals(cart_);
}

domain::CartSummary CartEngine::summary() const {
  std::lock_guard lock(mutex_);
  return domain::summarize(cart_);
}

domain::Cart CartEngine::snapshot() const {
  std::lock_guard lock(mutex_);
  return cart_;
}

bool CartEngine::empty() const {
  std::lock_guard lock(mutex_);
  return cart_.lines.empty();
}

std::size_t CartEngine::lineCount() const {
  std::lock_guard lock(mutex_);
  return cart_.lines.size();
}

// -----------------------------------------------------------------------------
// clear / default tax rate
// -----------------------------------------------------------------------------
void CartEngine::clear() {
  std::lock_guard lock(mutex_);
  clearLocked();
  std::cout << "[CartEngine] Cart cleared\n";
}

void CartEngine::clearLocked() {
  cart_.lines.clear();
  cart_.discount = 0.0;
  cart_.tax_rate_percent = default_tax_rate_;
  cart_.payment_method = domain::PaymentMethod::Cash;
}

void CartEngine::setDefaultTaxRate(double percent) {
  std::lock_guard lock(mutex_);
  default_tax_rate_ = clampRate(percent);
  if (cart_.lines.empty()) {
    cart_.tax_rate_percent = default_tax_rate_;
  }
}

// -----------------------------------------------------------------------------
// Private helpers (mutex_ held by caller)
// -----------------------------------------------------------------------------
std::size_t CartEngine::findLine(domain::MedicineId medicine_id) const {
  auto it = std::find_if(cart_.lines.begin(), cart_.lines.end(),
                         [medicine_id](const domain::CartLine& line) {
                           return line.medicine_id == medicine_id;
                         });
  return static_cast<std::size_t>(it - cart_.lines.begin());
}

double CartEngine::subtotalLocked() const {
  return domain::computeTotals(cart_).subtotal;
}

}  // namespace rxpos
