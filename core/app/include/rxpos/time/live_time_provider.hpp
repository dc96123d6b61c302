#pragma once

#include "rxpos/time/i_time_provider.hpp"

namespace rxpos {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// The clock the rxpos_server executable hands to PosEngine. Sales are dated
// with the till's actual date.
//
// Thread model:
//   system_clock::now() is safe from any thread; no internal state.
//
// Ownership:
//   Stack-local in main(); PosEngine borrows it.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace rxpos
