#pragma once

#include "credit/time/i_time_provider.hpp"

namespace credit {

// Wall-clock implementation of ITimeProvider backed by
// std::chrono::system_clock, truncated to whole seconds.
class LiveTimeProvider final : public ITimeProvider {
 public:
  LiveTimeProvider() = default;

  domain::Timestamp now_s() const override;
};

}  // namespace credit
