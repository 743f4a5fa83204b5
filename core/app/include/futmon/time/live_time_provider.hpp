#pragma once

#include "futmon/time/i_time_provider.hpp"

namespace futmon {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock and
//         sleeps with std::this_thread::sleep_for.
//
// @details
// Used by the production binary. system_clock (not steady_clock) because
// the values are compared with exchange timestamps and sent as the signed
// `timestamp` parameter.
//
// Thread model:
//   Stateless. Safe to call from any thread.
//
// Ownership:
//   Created in main() and passed by reference to the gateway, the cache and
//   the monitor.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;

  void sleep_for_ms(std::int64_t duration_ms) override;
};

}  // namespace futmon
