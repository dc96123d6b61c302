#pragma once

#include <cstdint>
#include <string>

namespace rxpos {

// -----------------------------------------------------------------------------
// Calendar utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that turn the engine clock (int64_t epoch
//         milliseconds from ITimeProvider) into the ISO strings stored in the
//         database, and validate ISO dates coming from callers.
//
// @details
// Sales and medicines store dates as TEXT: "YYYY-MM-DD" for business dates
// and "YYYY-MM-DDTHH:MM:SS" for audit timestamps. ISO strings sort
// lexically in date order, which the repositories' range queries rely on.
//
// Conversion uses the process's local time zone (localtime_r): a sale made
// at 23:30 local time belongs to that local business day.
//
// Thread-safety: Stateless and reentrant. Safe to call from any thread.
// -----------------------------------------------------------------------------

// Local calendar date of the given instant, "YYYY-MM-DD".
std::string isoDateFromMs(std::int64_t epoch_ms);

// Local date and time of the given instant, "YYYY-MM-DDTHH:MM:SS".
std::string isoDateTimeFromMs(std::int64_t epoch_ms);

// True when `text` is exactly "YYYY-MM-DD" and names a real calendar day
// (leap years honoured). "2024-02-30" and "2024-2-1" are rejected.
bool isValidIsoDate(const std::string& text);

// Adds `days` (may be negative) to a valid ISO date. Returns the input
// unchanged if it is not a valid date.
std::string addDays(const std::string& iso_date, int days);

}  // namespace rxpos
