#pragma once

#include "rxpos/events/pos_events.hpp"

#include <variant>

namespace rxpos {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type carried by the EventBus and the
// IPC telemetry queue. Adding an event kind means adding it here and to the
// IPC telemetry formatter.
// -----------------------------------------------------------------------------
using Event = std::variant<
    SaleCompletedEvent,
    StockAlertEvent,
    LowStockEvent>;

}  // namespace rxpos
