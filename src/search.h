#pragma once
// search.h -- Iterative-deepening alpha-beta driver and shared search result struct.
// Provides the public entry point used by the tools and the tests.

#include <atomic>
#include <chrono>
#include <functional>
#include <vector>

#include "board.h"
#include "book.h"
#include "eval.h"
#include "moveorder.h"
#include "qsearch.h"
#include "searchparams.h"
#include "timeman.h"

namespace gambit {

struct PV {
  std::vector<Move> line;
};

struct SearchResult {
  Move best{};
  PV pv;
  int depth{0};
  int seldepth{0};
  std::int64_t nodes{0};
  // White-positive.
  Score eval{0};
  std::int64_t elapsed_ms{0};
  bool aborted{false};
  bool from_book{false};
};

using SearchProgressFn = std::function<void(const SearchResult&)>;

/// Depth the search will run to for this root: the requested base depth plus
/// one when the root is tactically dense or highly forcing.
int select_depth(const Position& root, const Limits& limits);

/**
 * @brief Searches root and returns the best move found.
 *
 * The position is mutated during the search and restored before returning.
 * A null best move means the root has no legal moves or is not a valid
 * position. When the time budget or stop flag cuts an iteration short, the
 * last completed iteration's answer is returned.
 */
SearchResult search(Position& root, const Limits& limits, const OpeningBook* book = nullptr,
                    std::atomic<bool>* stop_flag = nullptr,
                    const SearchProgressFn* progress = nullptr);

/// Time-boxed search with default limits.
SearchResult search(Position& root, std::chrono::milliseconds budget);

}  // namespace gambit
