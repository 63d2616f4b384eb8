#pragma once
// motifs.h -- Tactical motif recognition for a single (position, move) pair.
// Used by move ordering, quiescence noise filtering and the evaluator.

#include <array>
#include <cstdint>
#include <string_view>

#include "board.h"

namespace gambit {

enum class MotifKind : std::uint8_t {
  Fork = 0,
  Pin,
  Skewer,
  DiscoveredAttack,
  Deflection,
  Sacrifice,
  EnPassant,
  BackRankThreat,
  MateInOne,
  MateInTwo,
  SmotheredMate,
  Count
};

inline constexpr std::size_t kMotifKindCount = static_cast<std::size_t>(MotifKind::Count);

std::string_view motif_name(MotifKind kind);

// Values used when sizing motif magnitudes. The king is worth nothing as
// material; kRoyalRank orders it above everything for pin/skewer relations.
inline constexpr std::array<Score, 6> kMotifPieceValues = {100, 320, 330, 500, 900, 0};
inline constexpr Score kMateInOneMagnitude = 10000;
inline constexpr Score kMateInTwoMagnitude = 5000;
inline constexpr Score kSmotheredMateMagnitude = 1000;
inline constexpr Score kEnPassantMagnitude = 100;
inline constexpr Score kBackRankMagnitude = 500;

Score motif_piece_value(PieceType type);

struct MotifSignals {
  std::array<Score, kMotifKindCount> magnitude{};

  [[nodiscard]] Score get(MotifKind kind) const {
    return magnitude[static_cast<std::size_t>(kind)];
  }
  void set(MotifKind kind, Score value) { magnitude[static_cast<std::size_t>(kind)] = value; }
  [[nodiscard]] bool present(MotifKind kind) const { return get(kind) > 0; }
  [[nodiscard]] bool any() const;
  [[nodiscard]] Score total() const;
};

/**
 * @brief Classifies the tactical content of a legal move.
 *
 * The move is played on a private copy of @p pos; the caller's position is
 * never touched. Every ray scan is bounded to seven steps per direction. A
 * mating move short-circuits and reports only the mate motifs.
 */
MotifSignals analyze(const Position& pos, Move move);

/// True when @p move gives check and every reply allows a mate in one.
/// Only checking moves are probed so the cost stays bounded by the replies.
bool forces_mate_in_two(const Position& pos, Move move);

}  // namespace gambit
