#include "perft.h"

namespace gambit {

namespace {

void classify_leaf(Position& pos, Move move, PerftStats& stats) {
  ++stats.nodes;
  if (pos.is_capture(move)) {
    ++stats.captures;
  }
  if (pos.is_en_passant(move)) {
    ++stats.en_passant;
  }
  if (pos.is_castling(move)) {
    ++stats.castles;
  }
  if (is_promotion_flag(move_flag(move))) {
    ++stats.promotions;
  }
  Undo undo;
  pos.make(move, undo);
  if (pos.in_check()) {
    ++stats.checks;
    if (!pos.has_legal_move()) {
      ++stats.checkmates;
    }
  }
  pos.unmake(move, undo);
}

}  // namespace

PerftStats& PerftStats::operator+=(const PerftStats& other) {
  nodes += other.nodes;
  captures += other.captures;
  en_passant += other.en_passant;
  castles += other.castles;
  promotions += other.promotions;
  checks += other.checks;
  checkmates += other.checkmates;
  return *this;
}

std::uint64_t perft(Position& pos, int depth) {
  if (depth <= 0) {
    return 1ULL;
  }
  MoveList moves;
  pos.generate_moves(moves, GenStage::All);
  // Bulk count at the frontier: the generator only emits legal moves.
  if (depth == 1) {
    return moves.size();
  }
  std::uint64_t nodes = 0;
  for (const Move move : moves) {
    Undo undo;
    pos.make(move, undo);
    nodes += perft(pos, depth - 1);
    pos.unmake(move, undo);
  }
  return nodes;
}

std::vector<std::pair<Move, std::uint64_t>> perft_divide(Position& pos, int depth) {
  std::vector<std::pair<Move, std::uint64_t>> split;
  if (depth <= 0) {
    return split;
  }
  MoveList moves;
  pos.generate_moves(moves, GenStage::All);
  split.reserve(moves.size());
  for (const Move move : moves) {
    Undo undo;
    pos.make(move, undo);
    split.emplace_back(move, perft(pos, depth - 1));
    pos.unmake(move, undo);
  }
  return split;
}

PerftStats perft_stats(Position& pos, int depth) {
  PerftStats stats;
  if (depth <= 0) {
    stats.nodes = 1;
    return stats;
  }
  MoveList moves;
  pos.generate_moves(moves, GenStage::All);
  for (const Move move : moves) {
    if (depth == 1) {
      classify_leaf(pos, move, stats);
      continue;
    }
    Undo undo;
    pos.make(move, undo);
    stats += perft_stats(pos, depth - 1);
    pos.unmake(move, undo);
  }
  return stats;
}

}  // namespace gambit
