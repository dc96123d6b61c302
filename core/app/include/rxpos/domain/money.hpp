#pragma once

#include <string>

namespace rxpos {
namespace money {

// -----------------------------------------------------------------------------
// Money helpers
// -----------------------------------------------------------------------------
//
// @brief  Two-decimal rounding and display formatting for monetary values.
//
// @details
// Amounts are carried as double (same as the price fields in the rest of the
// engine). Every intermediate value in the cart pricing pipeline is rounded
// to 2 decimals with round2() before it is used in the next step, so the
// exact rounding rule matters:
//
//   round2(x) rounds the EXACT binary value of x to the nearest multiple of
//   0.01, with exact ties going to the even neighbour, and returns the double
//   nearest to that decimal. round2(2.675) == 2.67 because 2.675 is stored as
//   2.67499999...; round2(0.125) == 0.12 because 0.125 is an exact tie.
//
// std::round(x * 100) / 100 does NOT satisfy this: the multiplication itself
// rounds, and ties go away from zero.
//
// Thread-safety: Stateless. Safe from any thread.
// -----------------------------------------------------------------------------

// Rounds to 2 decimal places (exact value, ties to even).
double round2(double value);

// Formats an amount with 2 decimals and a currency symbol prefix, e.g.
// formatCurrency(38.5, "$") == "$38.50". Negative amounts keep the sign in
// front of the symbol ("-$1.00").
std::string formatCurrency(double amount, const std::string& symbol = "$");

}  // namespace money
}  // namespace rxpos
