#include "moveorder.h"

#include <algorithm>

#include "motifs.h"

namespace gambit {

namespace {

struct ScoredMove {
  Move move{};
  int priority{0};
};

int capture_bonus(const Position& pos, Move move) {
  const PieceType victim = type_of(pos.captured_piece(move));
  if (victim == PieceType::None) {
    return 0;
  }
  return kOrderingPawnUnits[static_cast<int>(victim)] * kCaptureUnitBonus;
}

}  // namespace

int move_priority(const Position& pos, Move move) {
  int priority = analyze(pos, move).total();
  priority += capture_bonus(pos, move);
  if (pos.gives_check(move)) {
    priority += kCheckBonus;
  }
  if (is_promotion_flag(move_flag(move))) {
    priority += kPromotionBonus;
  }
  if (pos.is_castling(move)) {
    priority += kCastlingBonus;
  }
  return priority;
}

void order_moves(const Position& pos, MoveList& moves, Move hoist) {
  std::array<ScoredMove, kMaxMoves> scored{};
  const std::size_t count = moves.size();
  for (std::size_t idx = 0; idx < count; ++idx) {
    scored[idx] = ScoredMove{moves[idx], move_priority(pos, moves[idx])};
  }
  auto* first = scored.data();
  auto* last = first + count;
  std::stable_sort(first, last, [](const ScoredMove& lhs, const ScoredMove& rhs) {
    return lhs.priority > rhs.priority;
  });
  if (!hoist.is_null()) {
    auto* found = std::find_if(first, last,
                               [hoist](const ScoredMove& entry) { return entry.move == hoist; });
    if (found != last) {
      std::rotate(first, found, found + 1);
    }
  }
  for (std::size_t idx = 0; idx < count; ++idx) {
    moves[idx] = scored[idx].move;
  }
}

}  // namespace gambit
