#pragma once

#include "rxpos/domain/medicine.hpp"
#include "rxpos/domain/sale_record.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rxpos {

// -----------------------------------------------------------------------------
// ErrorKind
// -----------------------------------------------------------------------------
//
// @brief  Every way a cart or sale operation can fail, as a closed set the
//         front-end can switch on.
//
// @details
// Grouped by what the caller should do about it:
//
//   Caller input (fix and retry, nothing was changed):
//     InvalidQuantity, NegativeValue, ExceedsSubtotal, TaxRateOutOfRange,
//     InvalidPaymentMethod           : see isInvalidInput()
//     NotFound                       : medicine or cart line absent
//     InsufficientStock              : retry with a smaller quantity
//     EmptyCart, ValidationFailed    : Complete aborted before any write
//
//   Infrastructure (nothing was written, safe to retry as a new attempt):
//     PersistFailed
//
//   Data-consistency alarm (sale written, stock only partly adjusted):
//     StockAdjustmentFailed          : never retried automatically; the
//                                       operator must reconcile inventory.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  InvalidQuantity,
  NegativeValue,
  ExceedsSubtotal,
  TaxRateOutOfRange,
  InvalidPaymentMethod,
  NotFound,
  InsufficientStock,
  EmptyCart,
  ValidationFailed,
  PersistFailed,
  StockAdjustmentFailed,
};

// snake_case name used in IPC responses and logs ("insufficient_stock").
const char* toString(ErrorKind kind);

// True for the InvalidInput family (bad argument values, no side effects).
bool isInvalidInput(ErrorKind kind);

// -----------------------------------------------------------------------------
// PosError
// -----------------------------------------------------------------------------
// Responsibility: A failure with enough structured detail for exact-case
// messaging. Only the fields relevant to `kind` are populated:
//
//   InsufficientStock     → available, requested, medicine_id
//   NotFound              → medicine_id
//   ValidationFailed      → validation_errors
//   StockAdjustmentFailed → sale_id, medicine_id (the line that failed)
// -----------------------------------------------------------------------------
struct PosError {
  ErrorKind kind{ErrorKind::PersistFailed};
  std::string message;
  int available{0};
  int requested{0};
  std::vector<std::string> validation_errors;
  std::optional<domain::SaleId> sale_id;
  std::optional<domain::MedicineId> medicine_id;

  static PosError invalidQuantity(int requested);
  static PosError negativeValue(const std::string& what);
  static PosError exceedsSubtotal(double amount, double subtotal);
  static PosError taxRateOutOfRange(double percent);
  static PosError invalidPaymentMethod(const std::string& token);
  static PosError medicineNotFound(domain::MedicineId id);
  static PosError lineNotFound(domain::MedicineId id);
  static PosError insufficientStock(domain::MedicineId id, int available,
                                    int requested);
  static PosError emptyCart();
  static PosError validationFailed(std::vector<std::string> errors);
  static PosError persistFailed(const std::string& detail);
  static PosError stockAdjustmentFailed(domain::SaleId sale_id,
                                        domain::MedicineId medicine_id,
                                        const std::string& detail);
};

// Result of an operation with no value: std::nullopt means success.
using Status = std::optional<PosError>;

// -----------------------------------------------------------------------------
// Result<T>
// -----------------------------------------------------------------------------
//
// @brief  Value-or-error return type for operations that produce something.
//
// @details
// Normally exactly one of `value` / `error` is set. The one deliberate
// exception is SaleCommitProtocol's StockAdjustmentFailed outcome, which
// carries BOTH the persisted SaleRecord and the error, so the caller can see
// that the sale exists while still being told the stock is inconsistent
// (see partial()).
//
// ok() is defined by the absence of an error, never by the presence of a
// value.
// -----------------------------------------------------------------------------
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<PosError> error;

  bool ok() const { return !error.has_value(); }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result failure(PosError e) {
    Result r;
    r.error = std::move(e);
    return r;
  }

  static Result partial(T v, PosError e) {
    Result r;
    r.value = std::move(v);
    r.error = std::move(e);
    return r;
  }
};

}  // namespace rxpos
