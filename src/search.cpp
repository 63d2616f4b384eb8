#include "search.h"

#include <algorithm>
#include <array>
#include <sstream>

#include "debug.h"
#include "motifs.h"

namespace gambit {
namespace {

constexpr int kAdaptiveScanMoves = 15;
constexpr int kAdaptiveMotifMoves = 4;
constexpr int kAdaptiveHeavyMoves = 2;
constexpr Score kAdaptiveHeavyTotal = 500;
constexpr int kAdaptiveForcingMoves = 12;
constexpr int kMaxSearchDepth = kMaxPly / 2;

constexpr Score mated_score(int ply) { return -(kMateValue - ply); }

struct PvTable {
  std::array<std::array<Move, kMaxPly>, kMaxPly> moves{};
  std::array<int, kMaxPly> length{};

  void clear() {
    length.fill(0);
  }

  void reset_row(int ply) {
    if (ply >= 0 && ply < kMaxPly) {
      length[ply] = 0;
    }
  }

  void set(int ply, Move move) {
    GAMBIT_ASSERT(ply >= 0 && ply < kMaxPly);
    moves[ply][ply] = move;
    const int child_ply = ply + 1;
    const int child_length = (child_ply < kMaxPly) ? length[child_ply] : 0;
    for (int idx = 0; idx < child_length; ++idx) {
      moves[ply][ply + 1 + idx] = moves[child_ply][child_ply + idx];
    }
    length[ply] = child_length + 1;
  }

  void extract(int ply, std::vector<Move>& out) const {
    if (ply < 0 || ply >= kMaxPly) {
      out.clear();
      return;
    }
    const int count = std::clamp(length[ply], 0, kMaxPly - ply);
    out.assign(moves[ply].begin() + ply, moves[ply].begin() + ply + count);
  }
};

struct SearchState {
  SearchContext ctx;
  PvTable pv_table;
  Move hoist{};
  // Best root move of the iteration in progress, kept for aborted searches.
  Move root_best{};
  Score root_score{-kScoreInfinity};
};

void emit_search_trace_start(const Position& root, const Limits& limits, const TimeBudget& budget,
                             int depth) {
  if (!trace_enabled(TraceTopic::Search)) {
    return;
  }
  std::ostringstream oss;
  oss << "start stm=" << (root.side_to_move() == Color::White ? "white" : "black")
      << " depth=" << depth;
  if (limits.nodes >= 0) {
    oss << " node_limit=" << limits.nodes;
  }
  if (budget.bounded()) {
    oss << " soft_ms=" << budget.soft_ms << " hard_ms=" << budget.hard_ms;
  }
  oss << " pruning=" << (limits.enable_pruning ? "on" : "off")
      << " zobrist=0x" << std::hex << root.zobrist() << std::dec;
  trace_emit(TraceTopic::Search, oss.str());
}

void emit_search_trace_finish(const SearchResult& result) {
  if (!trace_enabled(TraceTopic::Search)) {
    return;
  }
  std::ostringstream oss;
  oss << "finish depth=" << result.depth
      << " nodes=" << result.nodes
      << " eval=" << result.eval;
  if (!result.best.is_null()) {
    oss << " best=" << move_to_uci(result.best);
  } else {
    oss << " best=0000";
  }
  if (!result.pv.line.empty()) {
    oss << " pv=";
    for (std::size_t idx = 0; idx < result.pv.line.size(); ++idx) {
      if (idx > 0) {
        oss << ',';
      }
      oss << move_to_uci(result.pv.line[idx]);
    }
  }
  if (result.aborted) {
    oss << " aborted=yes";
  }
  if (result.from_book) {
    oss << " book=yes";
  }
  trace_emit(TraceTopic::Search, oss.str());
}

void emit_iteration_trace(const SearchResult& result) {
  if (!trace_enabled(TraceTopic::Search)) {
    return;
  }
  std::ostringstream oss;
  oss << "iteration depth=" << result.depth
      << " seldepth=" << result.seldepth
      << " nodes=" << result.nodes
      << " eval=" << result.eval
      << " best=" << (result.best.is_null() ? std::string("0000") : move_to_uci(result.best))
      << " time_ms=" << result.elapsed_ms;
  trace_emit(TraceTopic::Search, oss.str());
}

Score negamax(Position& pos, int depth, Score alpha, Score beta, SearchState& state, int ply) {
  SearchContext& ctx = state.ctx;
  state.pv_table.reset_row(ply);
  ctx.nodes++;
  ctx.seldepth = std::max(ctx.seldepth, ply + 1);
  if (should_abort(ctx)) {
    return relative_eval(pos, ctx);
  }

  MoveList moves;
  pos.generate_moves(moves, GenStage::All);
  if (moves.empty()) {
    return pos.in_check() ? mated_score(ply) : kDrawScore;
  }
  if (ply > 0 && (pos.is_insufficient_material() || pos.is_fifty_move_draw())) {
    return kDrawScore;
  }
  if (depth <= 0) {
    return quiescence(pos, alpha, beta, ctx, ply, 0);
  }
  if (ply >= kMaxPly - 1) {
    return relative_eval(pos, ctx);
  }

  order_moves(pos, moves, ply == 0 ? state.hoist : Move{});

  Score best = -kScoreInfinity;
  for (const Move move : moves) {
    Undo undo;
    pos.make(move, undo);
    const Score score = -negamax(pos, depth - 1, -beta, -alpha, state, ply + 1);
    pos.unmake(move, undo);

    if (ctx.aborted) {
      return best > -kScoreInfinity ? best : score;
    }
    if (score > best) {
      best = score;
      state.pv_table.set(ply, move);
      if (ply == 0) {
        state.root_best = move;
        state.root_score = score;
      }
    }
    if (ctx.enable_pruning) {
      alpha = std::max(alpha, score);
      if (alpha >= beta) {
        break;
      }
    }
  }
  return best;
}

SearchResult finish(SearchResult result, const SearchState& state) {
  result.nodes = state.ctx.nodes;
  result.seldepth = state.ctx.seldepth;
  result.elapsed_ms = elapsed_ms(state.ctx);
  emit_search_trace_finish(result);
  return result;
}

}  // namespace

int select_depth(const Position& root, const Limits& limits) {
  int depth = limits.depth > 0 ? static_cast<int>(limits.depth) : kDefaultSearchDepth;
  depth = std::min(depth, kMaxSearchDepth);
  if (!limits.adaptive_depth) {
    return depth;
  }

  MoveList moves;
  root.generate_moves(moves, GenStage::All);
  int motif_moves = 0;
  int heavy_moves = 0;
  int forcing_moves = 0;
  // Motif density is read from the first moves only; forcing moves are
  // counted over the whole list.
  const std::size_t scan = std::min(moves.size(), static_cast<std::size_t>(kAdaptiveScanMoves));
  for (std::size_t idx = 0; idx < moves.size(); ++idx) {
    if (root.is_capture(moves[idx]) || root.gives_check(moves[idx])) {
      ++forcing_moves;
    }
    if (idx >= scan) {
      continue;
    }
    const MotifSignals signals = analyze(root, moves[idx]);
    if (signals.any()) {
      ++motif_moves;
      if (signals.total() >= kAdaptiveHeavyTotal) {
        ++heavy_moves;
      }
    }
  }
  const bool dense = motif_moves >= kAdaptiveMotifMoves && heavy_moves >= kAdaptiveHeavyMoves;
  if (dense || forcing_moves >= kAdaptiveForcingMoves) {
    depth = std::min(depth + 1, kMaxSearchDepth);
  }
  return depth;
}

SearchResult search(Position& root, const Limits& limits, const OpeningBook* book,
                    std::atomic<bool>* stop_flag, const SearchProgressFn* progress) {
  SearchState state;
  SearchContext& ctx = state.ctx;
  ctx.start_time = std::chrono::steady_clock::now();
  ctx.node_cap = limits.nodes;
  ctx.stop_flag = stop_flag;
  ctx.enable_pruning = limits.enable_pruning;
  ctx.quiescence_depth = std::max(0, limits.quiescence_depth);
  ctx.quiescence_width = std::max(0, limits.quiescence_width);
  ctx.eval = limits.eval;
  const TimeBudget time_budget = compute_time_budget(limits, root.side_to_move());
  ctx.hard_time_ms = time_budget.hard_ms;
  ctx.soft_time_ms = std::min(time_budget.soft_ms, time_budget.hard_ms);

  SearchResult result;

  if (!root.has_both_kings()) {
    result.eval = kInvalidPositionScore;
    return finish(result, state);
  }

  MoveList root_moves;
  root.generate_moves(root_moves, GenStage::All);
  if (root_moves.empty()) {
    result.eval = evaluate(root, limits.eval);
    return finish(result, state);
  }

  if (book != nullptr && limits.use_book) {
    const Move book_move = book->probe(root);
    if (!book_move.is_null() && root_moves.contains(book_move)) {
      result.best = book_move;
      result.pv.line.push_back(book_move);
      result.eval = evaluate(root, limits.eval);
      result.from_book = true;
      return finish(result, state);
    }
  }

  const int max_depth = select_depth(root, limits);
  emit_search_trace_start(root, limits, time_budget, max_depth);

  const int sign = color_sign(root.side_to_move());
  const bool draw_root = root.is_insufficient_material() || root.is_fifty_move_draw();
  bool have_completed = false;

  for (int current_depth = 1; current_depth <= max_depth; ++current_depth) {
    if (should_abort(ctx)) {
      break;
    }
    state.pv_table.clear();
    state.root_best = Move{};
    state.root_score = -kScoreInfinity;

    const Score score =
        negamax(root, current_depth, -kScoreInfinity, kScoreInfinity, state, 0);
    if (ctx.aborted) {
      break;
    }

    result.depth = current_depth;
    state.pv_table.extract(0, result.pv.line);
    result.best = result.pv.line.empty() ? state.root_best : result.pv.line.front();
    result.eval = draw_root ? kDrawScore : sign * score;
    result.nodes = ctx.nodes;
    result.seldepth = ctx.seldepth;
    result.elapsed_ms = elapsed_ms(ctx);
    have_completed = true;
    state.hoist = result.best;
    emit_iteration_trace(result);
    if (progress != nullptr) {
      (*progress)(result);
    }

    if (ctx.soft_time_ms > 0 && elapsed_ms(ctx) >= ctx.soft_time_ms) {
      break;
    }
  }

  result.aborted = ctx.aborted;
  if (!have_completed) {
    if (!state.root_best.is_null()) {
      result.best = state.root_best;
      result.eval = draw_root ? kDrawScore : sign * state.root_score;
    } else {
      order_moves(root, root_moves);
      result.best = root_moves[0];
      result.eval = evaluate(root, limits.eval);
    }
    result.pv.line.assign(1, result.best);
  }
  return finish(result, state);
}

SearchResult search(Position& root, std::chrono::milliseconds budget) {
  Limits limits;
  limits.movetime_ms = budget.count();
  return search(root, limits);
}

}  // namespace gambit
