#include "eval.h"

#include <algorithm>
#include <bit>
#include <functional>
#include <sstream>
#include <vector>

#include "attacks.h"
#include "debug.h"
#include "motifs.h"

namespace gambit {
namespace {

constexpr std::array<Score, 6> kMaterialUnits = {1, 3, 3, 5, 9, 0};
constexpr Score kMaterialScale = 100;
constexpr std::array<Score, 6> kMobilityWeights = {2, 4, 3, 3, 2, 0};
constexpr Score kKingSafetyScale = 20;
constexpr Score kDevelopmentScale = 10;
constexpr Score kCenterScale = 5;
constexpr Score kEvalBound = kMateThreshold - 1;

// Tables are laid out as seen from White with rank 8 on the first row.
using PieceSquareTable = std::array<Score, 64>;

constexpr PieceSquareTable kPawnTable = {
      0,   0,   0,   0,   0,   0,   0,   0,
     50,  50,  50,  50,  50,  50,  50,  50,
     10,  10,  20,  30,  30,  20,  10,  10,
      5,   5,  10,  25,  25,  10,   5,   5,
      0,   0,   0,  20,  20,   0,   0,   0,
      5,  -5, -10,   0,   0, -10,  -5,   5,
      5,  10,  10, -20, -20,  10,  10,   5,
      0,   0,   0,   0,   0,   0,   0,   0};

constexpr PieceSquareTable kKnightTable = {
    -50, -40, -30, -30, -30, -30, -40, -50,
    -40, -20,   0,   0,   0,   0, -20, -40,
    -30,   0,  10,  15,  15,  10,   0, -30,
    -30,   5,  15,  20,  20,  15,   5, -30,
    -30,   0,  15,  20,  20,  15,   0, -30,
    -30,   5,  10,  15,  15,  10,   5, -30,
    -40, -20,   0,   5,   5,   0, -20, -40,
    -50, -40, -30, -30, -30, -30, -40, -50};

constexpr PieceSquareTable kBishopTable = {
    -20, -10, -10, -10, -10, -10, -10, -20,
    -10,   0,   0,   0,   0,   0,   0, -10,
    -10,   0,   5,  10,  10,   5,   0, -10,
    -10,   5,   5,  10,  10,   5,   5, -10,
    -10,   0,  10,  10,  10,  10,   0, -10,
    -10,  10,  10,  10,  10,  10,  10, -10,
    -10,   5,   0,   0,   0,   0,   5, -10,
    -20, -10, -10, -10, -10, -10, -10, -20};

constexpr PieceSquareTable kRookTable = {
      0,   0,   0,   0,   0,   0,   0,   0,
      5,  10,  10,  10,  10,  10,  10,   5,
     -5,   0,   0,   0,   0,   0,   0,  -5,
     -5,   0,   0,   0,   0,   0,   0,  -5,
     -5,   0,   0,   0,   0,   0,   0,  -5,
     -5,   0,   0,   0,   0,   0,   0,  -5,
     -5,   0,   0,   0,   0,   0,   0,  -5,
      0,   0,   0,   5,   5,   0,   0,   0};

constexpr PieceSquareTable kQueenTable = {
    -20, -10, -10,  -5,  -5, -10, -10, -20,
    -10,   0,   0,   0,   0,   0,   0, -10,
    -10,   0,   5,   5,   5,   5,   0, -10,
     -5,   0,   5,   5,   5,   5,   0,  -5,
      0,   0,   5,   5,   5,   5,   0,  -5,
    -10,   5,   5,   5,   5,   5,   0, -10,
    -10,   0,   5,   0,   0,   0,   0, -10,
    -20, -10, -10,  -5,  -5, -10, -10, -20};

constexpr PieceSquareTable kKingMiddleTable = {
    -30, -40, -40, -50, -50, -40, -40, -30,
    -30, -40, -40, -50, -50, -40, -40, -30,
    -30, -40, -40, -50, -50, -40, -40, -30,
    -30, -40, -40, -50, -50, -40, -40, -30,
    -20, -30, -30, -40, -40, -30, -30, -20,
    -10, -20, -20, -20, -20, -20, -20, -10,
     20,  20,   0,   0,   0,   0,  20,  20,
     20,  30,  10,   0,   0,  10,  30,  20};

constexpr PieceSquareTable kKingEndTable = {
    -50, -40, -30, -20, -20, -30, -40, -50,
    -30, -20, -10,   0,   0, -10, -20, -30,
    -30, -10,  20,  30,  30,  20, -10, -30,
    -30, -10,  30,  40,  40,  30, -10, -30,
    -30, -10,  30,  40,  40,  30, -10, -30,
    -30, -10,  20,  30,  30,  20, -10, -30,
    -30, -30,   0,   0,   0,   0, -30, -30,
    -50, -30, -30, -30, -30, -30, -30, -50};

constexpr std::array<Square, 4> kCenterSquares = {Square::D4, Square::E4, Square::D5,
                                                  Square::E5};
// c3-f6 block.
constexpr Bitboard kExtendedCenter = 0x00003C3C3C3C0000ULL;

constexpr std::array<std::string_view, 3> kPhaseNames = {"opening", "middlegame", "endgame"};

const PieceSquareTable& table_for(PieceType type, GamePhase phase) {
  switch (type) {
    case PieceType::Pawn:
      return kPawnTable;
    case PieceType::Knight:
      return kKnightTable;
    case PieceType::Bishop:
      return kBishopTable;
    case PieceType::Rook:
      return kRookTable;
    case PieceType::Queen:
      return kQueenTable;
    default:
      return phase == GamePhase::Endgame ? kKingEndTable : kKingMiddleTable;
  }
}

int table_index(Color color, Square sq) {
  const Square white_sq = color == Color::White ? sq : mirror(sq);
  return (7 - static_cast<int>(rank_of(white_sq))) * 8 + static_cast<int>(file_of(white_sq));
}

Rank home_rank(Color color) {
  return color == Color::White ? Rank::R1 : Rank::R8;
}

Score material(const Position& pos, Color color) {
  Score sum = 0;
  for (int type = 0; type < 6; ++type) {
    sum += std::popcount(pos.pieces(color, static_cast<PieceType>(type))) *
           kMaterialUnits[type] * kMaterialScale;
  }
  return sum;
}

int pawn_mobility(const Position& pos, Color color, Square sq) {
  const int forward = color == Color::White ? 1 : -1;
  const int file = static_cast<int>(file_of(sq));
  const int rank = static_cast<int>(rank_of(sq));
  int moves = std::popcount(pawn_attacks(color, sq) & pos.occupancy(flip(color)));
  const int one = rank + forward;
  if (on_board(file, one) && pos.piece_on(make_square(file, one)) == Piece::None) {
    ++moves;
    const int start = color == Color::White ? 1 : 6;
    const int two = one + forward;
    if (rank == start && pos.piece_on(make_square(file, two)) == Piece::None) {
      ++moves;
    }
  }
  return moves;
}

// Piece-square plus pseudo-legal mobility.
Score positional(const Position& pos, Color color, GamePhase phase) {
  Score sum = 0;
  const Bitboard own = pos.occupancy(color);
  for (int raw = 0; raw < 6; ++raw) {
    const auto type = static_cast<PieceType>(raw);
    const PieceSquareTable& table = table_for(type, phase);
    Bitboard bb = pos.pieces(color, type);
    while (bb) {
      const Square sq = pop_lsb(bb);
      sum += table[table_index(color, sq)];
      const int mobility = type == PieceType::Pawn
                               ? pawn_mobility(pos, color, sq)
                               : std::popcount(pos.attacks_from(sq) & ~own);
      sum += mobility * kMobilityWeights[raw];
    }
  }
  return sum;
}

Score king_safety(const Position& pos, Color color) {
  const Square king = pos.king_square(color);
  int points = 0;
  const Rank home = home_rank(color);
  if (rank_of(king) == home) {
    const File file = file_of(king);
    if (file == File::G || file == File::C) {
      points += 2;
    }
    const int shield_rank = static_cast<int>(home) + (color == Color::White ? 1 : -1);
    const int king_file = static_cast<int>(file);
    for (int f = king_file - 1; f <= king_file + 1; ++f) {
      if (on_board(f, shield_rank) &&
          pos.piece_on(make_square(f, shield_rank)) == make_piece(color, PieceType::Pawn)) {
        ++points;
      }
    }
  }
  if (pos.in_check(color)) {
    points -= 2;
  }
  const Bitboard zone = king_attacks(king);
  if (std::popcount(zone & pos.attacked_squares(flip(color))) > 2) {
    points -= 1;
  }
  return points * kKingSafetyScale;
}

Score development(const Position& pos, Color color) {
  const bool white = color == Color::White;
  const Bitboard knight_home = white ? (bit(Square::B1) | bit(Square::G1))
                                     : (bit(Square::B8) | bit(Square::G8));
  const Bitboard bishop_home = white ? (bit(Square::C1) | bit(Square::F1))
                                     : (bit(Square::C8) | bit(Square::F8));
  int points = std::popcount(pos.pieces(color, PieceType::Knight) & ~knight_home) +
               std::popcount(pos.pieces(color, PieceType::Bishop) & ~bishop_home);

  const std::uint8_t rights = white ? (CastleWK | CastleWQ) : (CastleBK | CastleBQ);
  const Square king = pos.king_square(color);
  if ((pos.castling_rights() & rights) == 0 && rank_of(king) == home_rank(color) &&
      (file_of(king) == File::G || file_of(king) == File::C)) {
    points += 2;
  }

  const Bitboard queens = pos.pieces(color, PieceType::Queen);
  const Square queen_home = white ? Square::D1 : Square::D8;
  if (pos.game_ply() < 20 && queens != 0 && (queens & bit(queen_home)) == 0) {
    points -= 1;
  }
  return points * kDevelopmentScale;
}

Score center_control(const Position& pos, Color color) {
  int occupation = 0;
  int attacks = 0;
  for (const Square sq : kCenterSquares) {
    const Piece pc = pos.piece_on(sq);
    if (pc != Piece::None && color_of(pc) == color) {
      occupation += type_of(pc) == PieceType::Pawn ? 2 : 1;
    }
    attacks += std::popcount(pos.attackers_to(sq, color));
  }
  const int extended = std::popcount(pos.pieces(color, PieceType::Pawn) & kExtendedCenter);
  return (occupation + attacks / 2 + extended) * kCenterScale;
}

Score weighted_motifs(const MotifSignals& signals) {
  auto capped = [&](MotifKind kind, int tenths, Score cap) {
    return std::min(signals.get(kind) * tenths / 10, cap);
  };
  Score sum = 0;
  if (signals.present(MotifKind::MateInOne)) {
    sum += 2500;
  }
  if (signals.present(MotifKind::MateInTwo)) {
    sum += 1500;
  }
  if (signals.present(MotifKind::SmotheredMate)) {
    sum += 800;
  }
  if (signals.present(MotifKind::BackRankThreat)) {
    sum += 800;
  }
  sum += capped(MotifKind::Fork, 8, 600);
  sum += capped(MotifKind::Skewer, 9, 500);
  sum += capped(MotifKind::Pin, 7, 400);
  sum += capped(MotifKind::DiscoveredAttack, 6, 350);
  sum += capped(MotifKind::Deflection, 5, 300);
  sum += capped(MotifKind::Sacrifice, 4, 250);
  if (signals.present(MotifKind::EnPassant)) {
    sum += 120;
  }
  return sum;
}

void trace_eval(const Position& pos, const EvalTrace& trace) {
  if (!trace_enabled(TraceTopic::Eval)) {
    return;
  }
  std::ostringstream oss;
  oss << "stm=" << (pos.side_to_move() == Color::White ? "white" : "black")
      << " phase=" << phase_name(trace.phase);
  if (trace.terminal) {
    oss << " terminal=yes";
  } else {
    oss << " material=" << trace.material[0] - trace.material[1]
        << " positional=" << trace.positional[0] - trace.positional[1]
        << " king=" << trace.king_safety[0] - trace.king_safety[1]
        << " development=" << trace.development[0] - trace.development[1]
        << " center=" << trace.center[0] - trace.center[1]
        << " tactical=" << trace.tactical[0] - trace.tactical[1];
  }
  oss << " total=" << trace.total;
  trace_emit(TraceTopic::Eval, oss.str());
}

// Square index seen from the mover's side of the board.
int oriented_index(Square sq, Color mover) {
  const int idx = static_cast<int>(sq);
  return mover == Color::White ? idx : idx ^ 56;
}

// Puts captures, checks and promotions first, then walks from/to squares in
// the mover's own orientation, so a mirrored position samples mirrored moves.
void order_for_sampling(const Position& pos, MoveList& moves) {
  struct Keyed {
    int key;
    Move move;
  };
  const Color mover = pos.side_to_move();
  std::vector<Keyed> keyed;
  keyed.reserve(moves.size());
  for (const Move move : moves) {
    const bool forcing = pos.is_capture(move) || is_promotion_flag(move_flag(move)) ||
                         pos.gives_check(move);
    const int key = ((forcing ? 0 : 1) << 19) |
                    (oriented_index(from_square(move), mover) << 13) |
                    (oriented_index(to_square(move), mover) << 7) |
                    (static_cast<int>(move_flag(move)) << 3) |
                    static_cast<int>(promotion_type(move));
    keyed.push_back({key, move});
  }
  std::sort(keyed.begin(), keyed.end(),
            [](const Keyed& a, const Keyed& b) { return a.key < b.key; });
  for (std::size_t idx = 0; idx < keyed.size(); ++idx) {
    moves[idx] = keyed[idx].move;
  }
}

}  // namespace

std::string_view phase_name(GamePhase phase) {
  return kPhaseNames[static_cast<std::size_t>(phase)];
}

GamePhase game_phase(const Position& pos) {
  const int pieces = std::popcount(pos.occupancy());
  const int majors = std::popcount(
      pos.pieces(Color::White, PieceType::Rook) | pos.pieces(Color::White, PieceType::Queen) |
      pos.pieces(Color::Black, PieceType::Rook) | pos.pieces(Color::Black, PieceType::Queen));
  if (pieces <= 10 || majors <= 2) {
    return GamePhase::Endgame;
  }
  if (pos.game_ply() < 20 || pieces >= 28) {
    return GamePhase::Opening;
  }
  return GamePhase::Middlegame;
}

Score tactical_score(const Position& pos, Color color, const EvalConfig& config) {
  if (!config.tactical_weighting || config.tactical_move_prefix <= 0 ||
      config.tactical_top_k <= 0) {
    return 0;
  }
  Position scratch = pos;
  if (scratch.side_to_move() != color) {
    if (!config.null_move_threats || !Position::supports_null_move() || scratch.in_check()) {
      return 0;
    }
    Undo undo;
    scratch.make_null(undo);
  }
  if (scratch.in_check(flip(color))) {
    // The opponent is already in check after a pass; the reading would be
    // built on an illegal position.
    return 0;
  }

  MoveList moves;
  scratch.generate_moves(moves, GenStage::All);
  order_for_sampling(scratch, moves);
  const std::size_t limit =
      std::min(moves.size(), static_cast<std::size_t>(config.tactical_move_prefix));

  std::vector<Score> readings;
  readings.reserve(limit);
  for (std::size_t idx = 0; idx < limit; ++idx) {
    MotifSignals signals = analyze(scratch, moves[idx]);
    if (config.mate_in_two_probe && !signals.present(MotifKind::MateInOne) &&
        scratch.gives_check(moves[idx]) && forces_mate_in_two(scratch, moves[idx])) {
      signals.set(MotifKind::MateInTwo, kMateInTwoMagnitude);
    }
    if (signals.any()) {
      readings.push_back(weighted_motifs(signals));
    }
  }
  std::sort(readings.begin(), readings.end(), std::greater<>());
  const std::size_t keep =
      std::min(readings.size(), static_cast<std::size_t>(config.tactical_top_k));
  Score sum = 0;
  for (std::size_t idx = 0; idx < keep; ++idx) {
    sum += readings[idx];
  }
  return sum;
}

Score evaluate(const Position& pos, const EvalConfig& config, EvalTrace* trace) {
  EvalTrace local;
  EvalTrace& out = trace ? *trace : local;
  out = EvalTrace{};

  if (!pos.has_both_kings()) {
    out.terminal = true;
    out.total = kInvalidPositionScore;
    trace_eval(pos, out);
    return out.total;
  }

  if (!pos.has_legal_move()) {
    out.terminal = true;
    if (pos.in_check()) {
      out.total = pos.side_to_move() == Color::White ? -kMateValue : kMateValue;
    } else {
      out.total = kDrawScore;
    }
    trace_eval(pos, out);
    return out.total;
  }

  if (pos.is_insufficient_material() || pos.is_fifty_move_draw()) {
    out.terminal = true;
    out.total = kDrawScore;
    trace_eval(pos, out);
    return out.total;
  }

  out.phase = game_phase(pos);
  Score total = 0;
  for (const Color color : {Color::White, Color::Black}) {
    const int idx = color_index(color);
    out.material[idx] = material(pos, color);
    out.positional[idx] = positional(pos, color, out.phase);
    out.king_safety[idx] = out.phase == GamePhase::Endgame ? 0 : king_safety(pos, color);
    out.development[idx] = development(pos, color);
    out.center[idx] = center_control(pos, color);
    out.tactical[idx] = tactical_score(pos, color, config);
    const Score side = out.material[idx] + out.positional[idx] + out.king_safety[idx] +
                       out.development[idx] + out.center[idx] + out.tactical[idx];
    total += color_sign(color) * side;
  }
  out.total = std::clamp(total, -kEvalBound, kEvalBound);
  trace_eval(pos, out);
  return out.total;
}

Score evaluate(const Position& pos, EvalTrace* trace) {
  return evaluate(pos, EvalConfig{}, trace);
}

}  // namespace gambit
