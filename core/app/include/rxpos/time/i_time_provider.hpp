#pragma once

#include <cstdint>

namespace rxpos {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract clock interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that hides where "now" comes from.
//
// @details
// Every timestamp the engine writes (sale date, created_at, a medicine's
// updated_at) and every "today" it compares against (expiry checks) is read
// through this interface, never from std::chrono directly:
//
//   - LiveTimeProvider       → std::chrono::system_clock, used by the server.
//   - SimulationTimeProvider → value set explicitly, used by tests so that a
//                              sale made "at noon on 2024-03-15" lands on
//                              that business date every run.
//
// Components receive `const ITimeProvider&` and call now_ms().
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. Writers (e.g.
//   SimulationTimeProvider::advance_time) synchronize internally.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider must outlive every component that references it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch (UTC).
  //
  // @details
  // Calendar conversion to the local business date happens in
  // isoDateFromMs() / isoDateTimeFromMs(), not here.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace rxpos
