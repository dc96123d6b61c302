#include "rxpos/time/simulation_time_provider.hpp"

namespace rxpos {

SimulationTimeProvider::SimulationTimeProvider(std::int64_t start_ms)
    : current_time_ms_(start_ms) {}

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

}  // namespace rxpos
