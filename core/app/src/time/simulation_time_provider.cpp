#include "credit/time/simulation_time_provider.hpp"

namespace credit {

domain::Timestamp SimulationTimeProvider::now_s() const {
  return current_time_s_.load();
}

domain::Timestamp SimulationTimeProvider::advance_time(
    domain::Timestamp delta_s) {
  // fetch_add returns the previous value.
  return current_time_s_.fetch_add(delta_s) + delta_s;
}

void SimulationTimeProvider::set_time(domain::Timestamp new_time_s) {
  current_time_s_.store(new_time_s);
}

}  // namespace credit
