#pragma once

#include "futmon/events/monitor_events.hpp"

#include <variant>

namespace futmon {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope type carried by EventBus and EventLoopThread.
// std::variant keeps events as values: no heap allocation per event and no
// downcasts at the subscriber.
// -----------------------------------------------------------------------------
using Event = std::variant<
    DatasetRefreshedEvent,
    RefreshFailedEvent,
    CredentialsRejectedEvent,
    CredentialsRotatedEvent,
    MarginRatioAlertEvent>;

}  // namespace futmon
