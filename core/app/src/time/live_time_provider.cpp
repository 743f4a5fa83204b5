#include "futmon/time/live_time_provider.hpp"

#include <chrono>
#include <thread>

namespace futmon {

// -----------------------------------------------------------------------------
// now_ms(): delegate to system_clock and convert to epoch milliseconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_ms() const {
  auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             now.time_since_epoch())
      .count();
}

// -----------------------------------------------------------------------------
// sleep_for_ms(): real blocking sleep on the calling thread
// -----------------------------------------------------------------------------
void LiveTimeProvider::sleep_for_ms(std::int64_t duration_ms) {
  if (duration_ms <= 0) {
    return;
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
}

}  // namespace futmon
