#pragma once
// timeman.h -- Turns the clock fields of Limits into per-move deadlines.
// The soft deadline stops new iterations; the hard one aborts the search.

#include "common.h"
#include "searchparams.h"

namespace gambit {

struct TimeBudget {
  std::int64_t soft_ms{0};
  std::int64_t hard_ms{0};

  // Zero in either field means that deadline is not set.
  [[nodiscard]] bool bounded() const { return hard_ms > 0; }
};

/// Budget for the side to move. A fixed movetime wins over the clock and is
/// used for both deadlines; infinite or unconstrained limits yield {0, 0}.
TimeBudget compute_time_budget(const Limits& limits, Color stm);

}  // namespace gambit
