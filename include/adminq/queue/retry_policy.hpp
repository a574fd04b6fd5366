#pragma once

#include "adminq/core/constants.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace adminq {

struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{60000};

  // Delay before attempt `attempt + 1`: base * 2^(attempt-1), capped.
  [[nodiscard]] auto backoff(int attempt) const noexcept
      -> std::chrono::milliseconds {
    if (attempt < 1 || base_delay.count() <= 0) {
      return std::chrono::milliseconds{0};
    }
    int shift = std::min(attempt - 1, limits::kMaxBackoffShift);
    auto factor = std::int64_t{1} << shift;
    auto cap = max_delay.count();
    if (base_delay.count() > cap / factor) {
      return max_delay;
    }
    return std::min(base_delay * factor, max_delay);
  }

  [[nodiscard]] auto exhausted(int attempt) const noexcept -> bool {
    return attempt >= max_attempts;
  }
};

}  // namespace adminq
