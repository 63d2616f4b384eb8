#pragma once
// moveorder.h -- Move ordering for the search core.
// Priorities combine motif readings with capture, check, promotion and
// castling bonuses; ties keep the generator's order.

#include <array>

#include "board.h"

namespace gambit {

// Capture bonus per captured pawn unit; king capture never happens.
inline constexpr std::array<int, 6> kOrderingPawnUnits = {1, 3, 3, 5, 9, 0};
inline constexpr int kCaptureUnitBonus = 10;
inline constexpr int kCheckBonus = 50;
inline constexpr int kPromotionBonus = 100;
inline constexpr int kCastlingBonus = 30;

/// Ordering priority of a legal move; larger is searched earlier.
int move_priority(const Position& pos, Move move);

/**
 * @brief Sorts @p moves by descending priority.
 *
 * The sort is stable so equal priorities keep their input order. When
 * @p hoist is present in the list it is moved to the front regardless of its
 * priority (iterative deepening puts the previous best move there).
 */
void order_moves(const Position& pos, MoveList& moves, Move hoist = Move{});

}  // namespace gambit
