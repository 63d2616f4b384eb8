#include "attacks.h"

#include <bit>
#include <cstdlib>

namespace gambit {
namespace {

constexpr Bitboard kFileA = 0x0101010101010101ULL;
constexpr Bitboard kFileH = 0x8080808080808080ULL;

constexpr Bitboard north_east(Bitboard bb) { return (bb << 9) & ~kFileA; }
constexpr Bitboard north_west(Bitboard bb) { return (bb << 7) & ~kFileH; }
constexpr Bitboard south_east(Bitboard bb) { return (bb >> 7) & ~kFileA; }
constexpr Bitboard south_west(Bitboard bb) { return (bb >> 9) & ~kFileH; }

template <std::size_t N>
constexpr std::array<Bitboard, 64> leaper_table(const std::array<Direction, N>& offsets) {
  std::array<Bitboard, 64> table{};
  for (int sq = 0; sq < 64; ++sq) {
    Bitboard attacks = 0ULL;
    for (const Direction& d : offsets) {
      const int nf = (sq & 7) + d.df;
      const int nr = (sq >> 3) + d.dr;
      if (on_board(nf, nr)) {
        attacks |= 1ULL << (nr * 8 + nf);
      }
    }
    table[sq] = attacks;
  }
  return table;
}

constexpr std::array<Direction, 8> kKnightOffsets = {{
    {1, 2}, {2, 1}, {2, -1}, {1, -2}, {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}}};

constexpr std::array<Bitboard, 64> kKnightAttacks = leaper_table(kKnightOffsets);
constexpr std::array<Bitboard, 64> kKingAttacks = leaper_table(kQueenDirections);

constexpr std::array<std::array<Bitboard, 64>, 2> kPawnAttacks = [] {
  std::array<std::array<Bitboard, 64>, 2> table{};
  for (int sq = 0; sq < 64; ++sq) {
    const Bitboard bb = 1ULL << sq;
    table[0][sq] = north_east(bb) | north_west(bb);
    table[1][sq] = south_east(bb) | south_west(bb);
  }
  return table;
}();

// kRays[dir][sq]: every square from sq (exclusive) to the board edge.
constexpr std::array<std::array<Bitboard, 64>, 8> kRays = [] {
  std::array<std::array<Bitboard, 64>, 8> rays{};
  for (std::size_t dir = 0; dir < kQueenDirections.size(); ++dir) {
    const Direction d = kQueenDirections[dir];
    for (int sq = 0; sq < 64; ++sq) {
      Bitboard ray = 0ULL;
      int file = (sq & 7) + d.df;
      int rank = (sq >> 3) + d.dr;
      while (on_board(file, rank)) {
        ray |= 1ULL << (rank * 8 + file);
        file += d.df;
        rank += d.dr;
      }
      rays[dir][sq] = ray;
    }
  }
  return rays;
}();

Bitboard ray_attacks(std::size_t dir, Square sq, Bitboard occ) {
  const int idx = static_cast<int>(sq);
  Bitboard attacks = kRays[dir][idx];
  const Bitboard blockers = attacks & occ;
  if (blockers) {
    const bool increasing = dir < 4;
    const int blocker = increasing ? std::countr_zero(blockers)
                                   : 63 - std::countl_zero(blockers);
    attacks ^= kRays[dir][blocker];
  }
  return attacks;
}

}  // namespace

Bitboard rook_attacks(Square sq, Bitboard occ) {
  // N, E, S, W.
  return ray_attacks(0, sq, occ) | ray_attacks(1, sq, occ) |
         ray_attacks(4, sq, occ) | ray_attacks(5, sq, occ);
}

Bitboard bishop_attacks(Square sq, Bitboard occ) {
  // NE, NW, SE, SW.
  return ray_attacks(2, sq, occ) | ray_attacks(3, sq, occ) |
         ray_attacks(6, sq, occ) | ray_attacks(7, sq, occ);
}

Bitboard queen_attacks(Square sq, Bitboard occ) {
  return rook_attacks(sq, occ) | bishop_attacks(sq, occ);
}

Bitboard knight_attacks(Square sq) {
  return kKnightAttacks[static_cast<int>(sq)];
}

Bitboard king_attacks(Square sq) {
  return kKingAttacks[static_cast<int>(sq)];
}

Bitboard pawn_attacks(Color color, Square sq) {
  return kPawnAttacks[color_index(color)][static_cast<int>(sq)];
}

Bitboard piece_attacks(PieceType type, Color color, Square sq, Bitboard occ) {
  if (sq == Square::None) {
    return 0ULL;
  }
  switch (type) {
    case PieceType::Pawn:
      return pawn_attacks(color, sq);
    case PieceType::Knight:
      return knight_attacks(sq);
    case PieceType::Bishop:
      return bishop_attacks(sq, occ);
    case PieceType::Rook:
      return rook_attacks(sq, occ);
    case PieceType::Queen:
      return queen_attacks(sq, occ);
    case PieceType::King:
      return king_attacks(sq);
    case PieceType::None:
      break;
  }
  return 0ULL;
}

Bitboard between(Square a, Square b) {
  if (a == Square::None || b == Square::None || a == b) {
    return 0ULL;
  }
  const int df = static_cast<int>(file_of(b)) - static_cast<int>(file_of(a));
  const int dr = static_cast<int>(rank_of(b)) - static_cast<int>(rank_of(a));
  if (df != 0 && dr != 0 && std::abs(df) != std::abs(dr)) {
    return 0ULL;
  }
  const Direction step{(df > 0) - (df < 0), (dr > 0) - (dr < 0)};
  Bitboard mask = 0ULL;
  int file = static_cast<int>(file_of(a)) + step.df;
  int rank = static_cast<int>(rank_of(a)) + step.dr;
  while (make_square(file, rank) != b) {
    mask |= bit(make_square(file, rank));
    file += step.df;
    rank += step.dr;
  }
  return mask;
}

}  // namespace gambit
