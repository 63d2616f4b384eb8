#include "qsearch.h"

#include <algorithm>
#include <array>
#include <sstream>

#include "debug.h"
#include "motifs.h"
#include "moveorder.h"

namespace gambit {
namespace {

constexpr Score kLargeVictimValue = 300;
constexpr Score kNoisyMotifThreshold = 200;

struct NoisyMove {
  Move move{};
  Score value{0};
};

Score noisy_value(const Position& pos, Move move, const MotifSignals& signals) {
  const Piece victim = pos.captured_piece(move);
  if (victim != Piece::None) {
    return motif_piece_value(type_of(victim));
  }
  return signals.total();
}

bool noisy_with(const Position& pos, Move move, const MotifSignals& signals) {
  const Piece victim = pos.captured_piece(move);
  if (victim != Piece::None) {
    const Score victim_value = motif_piece_value(type_of(victim));
    const Score attacker_value = motif_piece_value(type_of(pos.piece_on(from_square(move))));
    if (victim_value >= attacker_value || victim_value >= kLargeVictimValue) {
      return true;
    }
  }
  if (is_promotion_flag(move_flag(move))) {
    return true;
  }
  if (pos.gives_check(move)) {
    // Recapture is judged after the move: leaving from can open a line onto to.
    Position after = pos;
    Undo undo;
    after.make(move, undo);
    if (!after.is_square_attacked(to_square(move), after.side_to_move())) {
      return true;
    }
  }
  return signals.total() >= kNoisyMotifThreshold;
}

}  // namespace

bool should_abort(SearchContext& ctx) {
  if (ctx.aborted) {
    return true;
  }
  if (ctx.stop_flag != nullptr && ctx.stop_flag->load(std::memory_order_acquire)) {
    ctx.aborted = true;
    return true;
  }
  if (ctx.node_cap >= 0 && ctx.nodes > ctx.node_cap) {
    ctx.aborted = true;
    return true;
  }
  if (ctx.hard_time_ms > 0 && elapsed_ms(ctx) >= ctx.hard_time_ms) {
    ctx.aborted = true;
    return true;
  }
  return false;
}

std::int64_t elapsed_ms(const SearchContext& ctx) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - ctx.start_time)
      .count();
}

Score relative_eval(const Position& pos, const SearchContext& ctx) {
  return color_sign(pos.side_to_move()) * evaluate(pos, ctx.eval);
}

bool is_noisy(const Position& pos, Move move) {
  return noisy_with(pos, move, analyze(pos, move));
}

void collect_noisy_moves(const Position& pos, MoveList& out, int width) {
  MoveList legal;
  pos.generate_moves(legal, GenStage::All);

  std::array<NoisyMove, kMaxMoves> noisy{};
  std::size_t count = 0;
  for (const Move move : legal) {
    const MotifSignals signals = analyze(pos, move);
    if (noisy_with(pos, move, signals)) {
      noisy[count++] = NoisyMove{move, noisy_value(pos, move, signals)};
    }
  }
  std::stable_sort(noisy.begin(), noisy.begin() + static_cast<std::ptrdiff_t>(count),
                   [](const NoisyMove& lhs, const NoisyMove& rhs) { return lhs.value > rhs.value; });
  count = std::min(count, static_cast<std::size_t>(std::max(width, 0)));

  out.clear();
  for (std::size_t idx = 0; idx < count; ++idx) {
    out.push_back(noisy[idx].move);
  }
  order_moves(pos, out);
}

Score quiescence(Position& pos, Score alpha, Score beta, SearchContext& ctx, int ply,
                 int qdepth) {
  ctx.nodes++;
  ctx.seldepth = std::max(ctx.seldepth, ply + 1);
  if (should_abort(ctx)) {
    return relative_eval(pos, ctx);
  }
  if (!pos.has_legal_move()) {
    return pos.in_check() ? -(kMateValue - ply) : kDrawScore;
  }

  const Score stand_pat = relative_eval(pos, ctx);
  const bool trace_q = trace_enabled(TraceTopic::QSearch);
  if (trace_q) {
    std::ostringstream oss;
    oss << "node ply=" << ply
        << " qdepth=" << qdepth
        << " stm=" << (pos.side_to_move() == Color::White ? 'w' : 'b')
        << " stand_pat=" << stand_pat
        << " alpha=" << alpha
        << " beta=" << beta;
    trace_emit(TraceTopic::QSearch, oss.str());
  }
  if (qdepth >= ctx.quiescence_depth || ply >= kMaxPly - 1) {
    return stand_pat;
  }
  Score best = stand_pat;
  if (ctx.enable_pruning) {
    if (stand_pat >= beta) {
      return stand_pat;
    }
    alpha = std::max(alpha, stand_pat);
  }

  MoveList moves;
  collect_noisy_moves(pos, moves, ctx.quiescence_width);
  for (const Move move : moves) {
    Undo undo;
    pos.make(move, undo);
    const Score score = -quiescence(pos, -beta, -alpha, ctx, ply + 1, qdepth + 1);
    pos.unmake(move, undo);
    if (score > best) {
      best = score;
    }
    if (trace_q) {
      std::ostringstream oss;
      oss << "result ply=" << ply
          << " move=" << move_to_uci(move)
          << " score=" << score
          << " best=" << best;
      trace_emit(TraceTopic::QSearch, oss.str());
    }
    if (ctx.aborted) {
      break;
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

}  // namespace gambit
