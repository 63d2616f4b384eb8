#pragma once
/**
 * @file attacks.h
 * @brief Attack helpers for sliding and leaper pieces.
 *
 * Leaper attacks come from constexpr tables. Sliding attacks use per-direction
 * ray tables with a single bit scan to find the first blocker, so every call
 * costs at most four table lookups per piece.
 */

#include <array>

#include "common.h"

namespace gambit {

struct Direction {
  int df;
  int dr;
};

// Order matters: the first four increase the square index.
inline constexpr std::array<Direction, 8> kQueenDirections = {{
    {0, 1}, {1, 0}, {1, 1}, {-1, 1}, {0, -1}, {-1, 0}, {1, -1}, {-1, -1}}};
inline constexpr std::array<Direction, 4> kRookDirections = {{
    {0, 1}, {1, 0}, {0, -1}, {-1, 0}}};
inline constexpr std::array<Direction, 4> kBishopDirections = {{
    {1, 1}, {-1, 1}, {1, -1}, {-1, -1}}};

constexpr bool is_diagonal(Direction dir) {
  return dir.df != 0 && dir.dr != 0;
}

Bitboard rook_attacks(Square sq, Bitboard occ);
Bitboard bishop_attacks(Square sq, Bitboard occ);
Bitboard queen_attacks(Square sq, Bitboard occ);
Bitboard knight_attacks(Square sq);
Bitboard king_attacks(Square sq);
Bitboard pawn_attacks(Color color, Square sq);

// Attack set of a piece of the given kind standing on sq.
Bitboard piece_attacks(PieceType type, Color color, Square sq, Bitboard occ);

// Squares strictly between a and b when they share a line, else empty.
Bitboard between(Square a, Square b);

}  // namespace gambit
