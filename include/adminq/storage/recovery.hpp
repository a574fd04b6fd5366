#pragma once

#include "adminq/core/error.hpp"
#include "adminq/queue/task.hpp"
#include "adminq/storage/persistence.hpp"

#include <vector>

namespace adminq {

struct RecoveryResult {
  // Every retained task, in submission order, with interrupted attempts
  // already rewound.
  std::vector<Task> tasks;
  int requeued{0};
  int cancelled{0};
  int failed{0};
};

// Rewinds tasks left Running by an unclean exit. A task whose interrupted
// attempt was its last one is failed instead of re-queued.
class Recovery {
public:
  Recovery(Persistence& persistence, int max_attempts);

  [[nodiscard]] auto recover() -> Result<RecoveryResult>;

private:
  Persistence& persistence_;
  int max_attempts_;
};

}  // namespace adminq
