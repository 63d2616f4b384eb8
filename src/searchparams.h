#pragma once
// searchparams.h -- POD containers for search configuration.
// Shared between the search core, the time manager and the tools.

#include <cstdint>

#include "eval.h"

namespace gambit {

inline constexpr int kDefaultSearchDepth = 4;
inline constexpr int kQuiescenceDepthDefault = 3;
inline constexpr int kQuiescenceWidthDefault = 8;

struct Limits {
  std::int64_t movetime_ms{-1};
  std::int64_t nodes{-1};
  // Base depth; -1 selects kDefaultSearchDepth.
  std::int16_t depth{-1};
  std::int64_t wtime_ms{-1};
  std::int64_t btime_ms{-1};
  std::int64_t winc_ms{0};
  std::int64_t binc_ms{0};
  int movestogo{-1};
  // One extra ply on tactically dense or forcing roots.
  bool adaptive_depth{true};
  // false runs plain minimax with the full window at every node.
  bool enable_pruning{true};
  int quiescence_depth{kQuiescenceDepthDefault};
  int quiescence_width{kQuiescenceWidthDefault};
  bool use_book{true};
  bool infinite{false};
  EvalConfig eval{};
};

}  // namespace gambit
