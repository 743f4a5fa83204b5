#pragma once

#include "futmon/domain/dataset.hpp"
#include "futmon/errors/fetch_result.hpp"

#include <cstdint>
#include <string>

namespace futmon {

// -----------------------------------------------------------------------------
// Monitor notification events
// -----------------------------------------------------------------------------
//
// Best-effort notifications to observers (log sink, IPC telemetry). Losing
// one is harmless: the authoritative data is always re-read through the
// monitor's getters, never reconstructed from events.
// -----------------------------------------------------------------------------

// A remote fetch for `key` completed and the cache now holds fresh data.
struct DatasetRefreshedEvent {
  domain::Dataset dataset{domain::Dataset::Account};
  std::string key;
  std::int64_t fetched_at_ms{0};
  std::int64_t duration_ms{0};
};

// A remote fetch for `key` failed. Readers keep getting the previous value
// (stale) if there was one.
struct RefreshFailedEvent {
  domain::Dataset dataset{domain::Dataset::Account};
  std::string key;
  FetchError error;
  std::int64_t at_ms{0};
};

// The exchange rejected the API key. Nothing will be fetched again until
// the credentials are rotated.
struct CredentialsRejectedEvent {
  std::string masked_key;
  std::string reason;
  std::int64_t at_ms{0};
};

// A new gateway replaced the old one and the whole cache was dropped.
struct CredentialsRotatedEvent {
  std::string masked_key;
  std::int64_t at_ms{0};
};

// Margin ratio above the configured threshold, computed from fresh (never
// stale) inputs.
struct MarginRatioAlertEvent {
  double margin_ratio{0.0};
  double threshold{0.0};
  double total_equity{0.0};
  std::int64_t at_ms{0};
};

}  // namespace futmon
