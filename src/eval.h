#pragma once
/// @file eval.h
/// @brief Static evaluation: material, piece-square, mobility, king safety,
/// development, center control and a tactical awareness term.
/// @details Scores are White-positive. Non-terminal scores stay strictly
/// inside the mate band so search can tell them apart from forced mates.

#include <array>
#include <cstdint>
#include <string_view>

#include "board.h"

namespace gambit {

enum class GamePhase : std::uint8_t { Opening = 0, Middlegame, Endgame };

std::string_view phase_name(GamePhase phase);

struct EvalConfig {
  bool tactical_weighting{true};
  // How many legal moves per side feed the tactical term, and how many of
  // the strongest of those are summed.
  int tactical_move_prefix{15};
  int tactical_top_k{3};
  // Score the side not to move by simulating a pass.
  bool null_move_threats{true};
  // Probe checking candidates for a forced mate in two.
  bool mate_in_two_probe{true};
};

/// Per-side breakdown filled by evaluate() when a trace is requested. Index 0
/// is White, 1 is Black; each entry is that side's own (positive-is-good)
/// contribution.
struct EvalTrace {
  GamePhase phase{GamePhase::Opening};
  std::array<Score, 2> material{};
  std::array<Score, 2> positional{};
  std::array<Score, 2> king_safety{};
  std::array<Score, 2> development{};
  std::array<Score, 2> center{};
  std::array<Score, 2> tactical{};
  bool terminal{false};
  Score total{0};
};

GamePhase game_phase(const Position& pos);

/// Weighted tactical threat score of @p color: the top-k motif readings over
/// the first legal moves of that side. Zero when the side cannot be scored
/// (tactics disabled, side to move in check while a pass would be needed, or
/// a board without null-move support).
Score tactical_score(const Position& pos, Color color, const EvalConfig& config);

Score evaluate(const Position& pos, const EvalConfig& config, EvalTrace* trace = nullptr);
Score evaluate(const Position& pos, EvalTrace* trace = nullptr);

}  // namespace gambit
