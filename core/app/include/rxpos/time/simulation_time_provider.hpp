#pragma once

#include "rxpos/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace rxpos {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly rather than
//         read from the system clock.
//
// @details
// Used wherever a deterministic date is needed: repository and protocol
// tests pin the clock to a known instant so that sale dates, expiry checks,
// and date-range queries give the same answers on every run.
//
// Tests pick instants around 12:00 UTC so that the local calendar date is the
// same in every time zone between UTC-11 and UTC+11.
//
// Internal storage is a std::atomic<int64_t>: advance_time() may be called
// from a test thread while engine threads read now_ms().
//
// Ownership:
//   Owned by the test fixture; passed by reference to the components under
//   test.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  // Starts the clock at the given instant instead of the epoch.
  explicit SimulationTimeProvider(std::int64_t start_ms);

  // Returns the last value set by advance_time() (0 if never set).
  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given instant.
  //
  // @details
  // Monotonicity is not enforced; tests may move the clock backwards to set
  // up records dated in the past.
  //
  // Thread-safety: Safe to call from any thread.
  // Side-effects:  Changes the value returned by now_ms() for every reader.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace rxpos
