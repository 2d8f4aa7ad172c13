#include "credit/time/live_time_provider.hpp"

#include <chrono>

namespace credit {

domain::Timestamp LiveTimeProvider::now_s() const {
  // system_clock's epoch is the Unix epoch (guaranteed since C++20 and true
  // on every platform we build for).
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<domain::Timestamp>(
      std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

}  // namespace credit
