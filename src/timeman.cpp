#include "timeman.h"

#include <algorithm>

namespace {

constexpr std::int64_t kSafetyMarginMs = 50;
constexpr std::int64_t kMinMoveTimeMs = 1;
constexpr std::int64_t kHardSlackMs = 50;
constexpr int kDefaultMovesToGo = 20;

}  // namespace

namespace gambit {

TimeBudget compute_time_budget(const Limits& limits, Color stm) {
  TimeBudget budget{};

  if (limits.infinite) {
    return budget;
  }

  // A fixed move time is a hard wall: no slack past it.
  if (limits.movetime_ms >= 0) {
    const std::int64_t move_time = std::max(limits.movetime_ms, kMinMoveTimeMs);
    budget.soft_ms = move_time;
    budget.hard_ms = move_time;
    return budget;
  }

  const std::int64_t time_left = stm == Color::White ? limits.wtime_ms : limits.btime_ms;
  const std::int64_t increment = stm == Color::White ? limits.winc_ms : limits.binc_ms;

  if (time_left < 0) {
    if (increment > 0) {
      const std::int64_t alloc = std::max(increment / 2, kMinMoveTimeMs);
      budget.soft_ms = alloc;
      budget.hard_ms = alloc + kHardSlackMs;
    }
    return budget;
  }

  const int divisor = limits.movestogo > 0 ? limits.movestogo : kDefaultMovesToGo;
  std::int64_t allocate = time_left / divisor + std::max<std::int64_t>(increment / 2, 0);

  const std::int64_t safety_margin =
      std::min(kSafetyMarginMs, std::max<std::int64_t>(time_left / 10, 0));
  const std::int64_t max_allowed =
      time_left > safety_margin ? time_left - safety_margin : time_left;
  allocate = std::min(allocate, max_allowed);
  allocate = std::clamp<std::int64_t>(allocate, std::min(kMinMoveTimeMs, time_left), time_left);

  budget.soft_ms = allocate;
  budget.hard_ms = std::min(time_left, allocate + kHardSlackMs);
  budget.hard_ms = std::max(budget.hard_ms, budget.soft_ms);
  return budget;
}

}  // namespace gambit
