#include "futmon/time/simulation_time_provider.hpp"

namespace futmon {

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// sleep_for_ms(): simulated sleep
// -----------------------------------------------------------------------------
// fetch_add rather than load+store: two threads backing off at the same time
// must both move the clock, otherwise one of the delays would be lost.
// -----------------------------------------------------------------------------
void SimulationTimeProvider::sleep_for_ms(std::int64_t duration_ms) {
  if (duration_ms <= 0) {
    return;
  }
  current_time_ms_.fetch_add(duration_ms);
}

void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

void SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  current_time_ms_.fetch_add(delta_ms);
}

}  // namespace futmon
