#include "rxpos/domain/money.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace rxpos {
namespace money {

// -----------------------------------------------------------------------------
// round2()
// -----------------------------------------------------------------------------
// printf's "%.2f" conversion works from the exact binary value and resolves
// exact ties with the current rounding mode (round-half-even by default).
// strtod() then returns the double nearest to the printed decimal.
// -----------------------------------------------------------------------------
double round2(double value) {
  if (!std::isfinite(value)) {
    return value;
  }

  char buffer[64];
  int written = std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  if (written <= 0 || written >= static_cast<int>(sizeof(buffer))) {
    // Magnitude too large for the buffer: already integral at 2 decimals.
    return value;
  }

  double rounded = std::strtod(buffer, nullptr);
  // Normalise -0.00 to 0.00 so totals never display as negative zero.
  return rounded == 0.0 ? 0.0 : rounded;
}

// -----------------------------------------------------------------------------
// formatCurrency()
// -----------------------------------------------------------------------------
std::string formatCurrency(double amount, const std::string& symbol) {
  double rounded = round2(amount);

  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.2f", std::fabs(rounded));

  std::string out;
  if (rounded < 0.0) {
    out += '-';
  }
  out += symbol;
  out += buffer;
  return out;
}

}  // namespace money
}  // namespace rxpos
