#pragma once
// qsearch.h -- Shared search context, abort polling and the quiescence
// extension that resolves noisy moves at the horizon.

#include <atomic>
#include <chrono>
#include <cstdint>

#include "board.h"
#include "eval.h"

namespace gambit {

struct SearchContext {
  std::int64_t nodes{0};
  std::int64_t node_cap{-1};
  int seldepth{0};
  std::chrono::steady_clock::time_point start_time{};
  std::int64_t soft_time_ms{0};
  std::int64_t hard_time_ms{0};
  std::atomic<bool>* stop_flag{nullptr};
  bool aborted{false};
  bool enable_pruning{true};
  int quiescence_depth{3};
  int quiescence_width{8};
  EvalConfig eval{};
};

/// Polls the stop flag, the node cap and the hard deadline. Sets
/// ctx.aborted and stays true once tripped.
bool should_abort(SearchContext& ctx);
std::int64_t elapsed_ms(const SearchContext& ctx);

/// Static evaluation from the side to move's point of view.
Score relative_eval(const Position& pos, const SearchContext& ctx);

/// True for moves quiescence keeps exploring: favourable or large captures,
/// checks onto unattacked squares, promotions and motif-rich moves.
bool is_noisy(const Position& pos, Move move);

/// Noisy legal moves, strongest first, at most @p width of them, in search
/// order.
void collect_noisy_moves(const Position& pos, MoveList& out, int width);

/**
 * @brief Fail-soft quiescence search in the negamax frame.
 *
 * The static evaluation always serves as a floor (stand pat), so the result
 * is never below it. Positions without legal moves score as mate or
 * stalemate; qdepth counts noisy plies and stops at ctx.quiescence_depth.
 */
Score quiescence(Position& pos, Score alpha, Score beta, SearchContext& ctx, int ply,
                 int qdepth);

}  // namespace gambit
