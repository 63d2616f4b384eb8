#include "motifs.h"

#include <bit>
#include <sstream>

#include "attacks.h"
#include "debug.h"

namespace gambit {
namespace {

constexpr int kMaxRaySteps = 7;
constexpr int kRoyalRank = 1'000'000;

constexpr std::array<std::string_view, kMotifKindCount> kMotifNames = {
    "fork",       "pin",       "skewer",   "discovered", "deflection",
    "sacrifice",  "enpassant", "backrank", "mate1",      "mate2",
    "smothered"};

int relation_rank(PieceType type) {
  return type == PieceType::King ? kRoyalRank : motif_piece_value(type);
}

Score scaled(Score value, int tenths) {
  return value * tenths / 10;
}

// First occupied square walking from origin (exclusive) along dir, or None
// when the edge or the step limit is reached first.
Square first_piece_along(const Position& pos, Square origin, Direction dir) {
  int file = static_cast<int>(file_of(origin)) + dir.df;
  int rank = static_cast<int>(rank_of(origin)) + dir.dr;
  for (int step = 0; step < kMaxRaySteps && on_board(file, rank); ++step) {
    const Square sq = make_square(file, rank);
    if (pos.piece_on(sq) != Piece::None) {
      return sq;
    }
    file += dir.df;
    rank += dir.dr;
  }
  return Square::None;
}

bool is_enemy(const Position& pos, Square sq, Color us) {
  if (sq == Square::None) {
    return false;
  }
  const Piece pc = pos.piece_on(sq);
  return pc != Piece::None && color_of(pc) != us;
}

Score fork_magnitude(const Position& after, Square to, Color us) {
  Bitboard targets = after.attacks_from(to) & after.occupancy(flip(us));
  if (std::popcount(targets) < 2) {
    return 0;
  }
  Score sum = 0;
  bool royal = false;
  while (targets) {
    const PieceType type = type_of(after.piece_on(pop_lsb(targets)));
    royal = royal || type == PieceType::King;
    sum += motif_piece_value(type);
  }
  return royal ? sum * 2 : sum;
}

template <std::size_t N>
void scan_line_tactics(const Position& after, Square to, Color us,
                       const std::array<Direction, N>& dirs, MotifSignals& out) {
  Score pin = 0;
  Score skewer = 0;
  for (const Direction dir : dirs) {
    const Square front = first_piece_along(after, to, dir);
    if (!is_enemy(after, front, us)) {
      continue;
    }
    const Square back = first_piece_along(after, front, dir);
    if (!is_enemy(after, back, us)) {
      continue;
    }
    const PieceType front_type = type_of(after.piece_on(front));
    const PieceType back_type = type_of(after.piece_on(back));
    const int front_rank = relation_rank(front_type);
    const int back_rank = relation_rank(back_type);
    if (front_rank < back_rank) {
      pin += scaled(motif_piece_value(front_type), 7);
    } else if (front_rank > back_rank) {
      skewer += scaled(motif_piece_value(back_type), 9);
    }
  }
  out.set(MotifKind::Pin, pin);
  out.set(MotifKind::Skewer, skewer);
}

// The moved piece itself never counts as the uncovered slider, so a slider
// retreating along its own line reads 0.
Score discovered_magnitude(const Position& after, Square from, Square to, Color us) {
  Score sum = 0;
  for (const Direction dir : kQueenDirections) {
    const Square behind = first_piece_along(after, from, Direction{-dir.df, -dir.dr});
    if (behind == Square::None || behind == to) {
      continue;
    }
    const Piece slider = after.piece_on(behind);
    const PieceType slider_type = type_of(slider);
    if (color_of(slider) != us) {
      continue;
    }
    const bool sees_line = slider_type == PieceType::Queen ||
                           (is_diagonal(dir) ? slider_type == PieceType::Bishop
                                             : slider_type == PieceType::Rook);
    if (!sees_line) {
      continue;
    }
    const Square target = first_piece_along(after, from, dir);
    if (is_enemy(after, target, us)) {
      sum += scaled(motif_piece_value(type_of(after.piece_on(target))), 6);
    }
  }
  return sum;
}

// Defender's king boxed in on its home rank while an attacking rook or queen
// already reaches that rank.
bool back_rank_exposed(const Position& after, Color defender) {
  const Square king_sq = after.king_square(defender);
  if (king_sq == Square::None) {
    return false;
  }
  const Rank home = defender == Color::White ? Rank::R1 : Rank::R8;
  if (rank_of(king_sq) != home) {
    return false;
  }
  const Color attacker = flip(defender);
  const Bitboard home_mask = 0xFFULL << (8 * static_cast<int>(home));
  Bitboard heavies =
      after.pieces(attacker, PieceType::Rook) | after.pieces(attacker, PieceType::Queen);
  bool eyes_rank = false;
  while (heavies && !eyes_rank) {
    eyes_rank = (rook_attacks(pop_lsb(heavies), after.occupancy()) & home_mask) != 0;
  }
  if (!eyes_rank) {
    return false;
  }
  const int forward = defender == Color::White ? 1 : -1;
  const int rank = static_cast<int>(home) + forward;
  const int king_file = static_cast<int>(file_of(king_sq));
  int empty = 0;
  for (int file = king_file - 1; file <= king_file + 1; ++file) {
    if (on_board(file, rank) && after.piece_on(make_square(file, rank)) == Piece::None) {
      ++empty;
    }
  }
  return empty <= 1;
}

bool is_smothered(const Position& after, Color mated) {
  const Square king_sq = after.king_square(mated);
  const Bitboard checkers = after.attackers_to(king_sq, flip(mated));
  if (!(checkers & after.pieces(flip(mated), PieceType::Knight))) {
    return false;
  }
  const Bitboard ring = king_attacks(king_sq);
  return (ring & after.occupancy(mated)) == ring;
}

void trace_signals(const Position& pos, Move move, const MotifSignals& signals) {
  if (!trace_enabled(TraceTopic::Motifs) || !signals.any()) {
    return;
  }
  std::ostringstream oss;
  oss << "move=" << move_to_uci(move) << " stm="
      << (pos.side_to_move() == Color::White ? 'w' : 'b');
  for (std::size_t idx = 0; idx < kMotifKindCount; ++idx) {
    if (signals.magnitude[idx] > 0) {
      oss << ' ' << kMotifNames[idx] << '=' << signals.magnitude[idx];
    }
  }
  oss << " total=" << signals.total();
  trace_emit(TraceTopic::Motifs, oss.str());
}

}  // namespace

std::string_view motif_name(MotifKind kind) {
  const auto idx = static_cast<std::size_t>(kind);
  return idx < kMotifNames.size() ? kMotifNames[idx] : std::string_view{"unknown"};
}

Score motif_piece_value(PieceType type) {
  return type == PieceType::None ? 0 : kMotifPieceValues[static_cast<int>(type)];
}

bool MotifSignals::any() const {
  for (const Score value : magnitude) {
    if (value > 0) {
      return true;
    }
  }
  return false;
}

Score MotifSignals::total() const {
  Score sum = 0;
  for (const Score value : magnitude) {
    sum += value;
  }
  return sum;
}

bool forces_mate_in_two(const Position& pos, Move move) {
  if (move.is_null()) {
    return false;
  }
  Position after = pos;
  Undo undo;
  after.make(move, undo);
  if (!after.in_check(after.side_to_move())) {
    return false;
  }
  MoveList replies;
  after.generate_moves(replies, GenStage::All);
  if (replies.empty()) {
    // Already mate; reported as mate in one instead.
    return false;
  }
  for (const Move reply : replies) {
    Undo reply_undo;
    after.make(reply, reply_undo);
    MoveList finishers;
    after.generate_moves(finishers, GenStage::All);
    bool mates = false;
    for (const Move finisher : finishers) {
      Undo finish_undo;
      after.make(finisher, finish_undo);
      mates = after.is_checkmate();
      after.unmake(finisher, finish_undo);
      if (mates) {
        break;
      }
    }
    after.unmake(reply, reply_undo);
    if (!mates) {
      return false;
    }
  }
  return true;
}

MotifSignals analyze(const Position& pos, Move move) {
  MotifSignals signals;
  if (move.is_null()) {
    return signals;
  }

  const Color us = pos.side_to_move();
  const Color them = flip(us);
  const Square from = from_square(move);
  const Square to = to_square(move);
  const PieceType mover_type = type_of(pos.piece_on(from));
  const Piece captured = pos.captured_piece(move);

  Position after = pos;
  Undo undo;
  after.make(move, undo);

  if (after.is_checkmate()) {
    signals.set(MotifKind::MateInOne, kMateInOneMagnitude);
    if (is_smothered(after, them)) {
      signals.set(MotifKind::SmotheredMate, kSmotheredMateMagnitude);
    }
    trace_signals(pos, move, signals);
    return signals;
  }

  const PieceType landed_type = type_of(after.piece_on(to));
  signals.set(MotifKind::Fork, fork_magnitude(after, to, us));

  switch (landed_type) {
    case PieceType::Bishop:
      scan_line_tactics(after, to, us, kBishopDirections, signals);
      break;
    case PieceType::Rook:
      scan_line_tactics(after, to, us, kRookDirections, signals);
      break;
    case PieceType::Queen:
      scan_line_tactics(after, to, us, kQueenDirections, signals);
      break;
    default:
      break;
  }

  signals.set(MotifKind::DiscoveredAttack, discovered_magnitude(after, from, to, us));

  if (captured != Piece::None) {
    const Score captured_value = motif_piece_value(type_of(captured));
    const Score mover_value = motif_piece_value(mover_type);
    signals.set(MotifKind::Deflection, scaled(captured_value, 3));
    if (mover_value > captured_value && after.in_check(them)) {
      signals.set(MotifKind::Sacrifice, scaled(mover_value - captured_value, 5));
    }
  }

  if (move_flag(move) == MoveFlag::EnPassant) {
    signals.set(MotifKind::EnPassant, kEnPassantMagnitude);
  }

  if (back_rank_exposed(after, them)) {
    signals.set(MotifKind::BackRankThreat, kBackRankMagnitude);
  }

  trace_signals(pos, move, signals);
  return signals;
}

}  // namespace gambit
