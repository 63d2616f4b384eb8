#pragma once
// perft.h -- Move-generator validation: leaf counts and per-kind leaf
// breakdowns over the legal move tree.

#include <cstdint>
#include <utility>
#include <vector>

#include "board.h"

namespace gambit {

// Leaf classification in the usual perft-table columns. Captures include en
// passant; checks include mates.
struct PerftStats {
  std::uint64_t nodes{0};
  std::uint64_t captures{0};
  std::uint64_t en_passant{0};
  std::uint64_t castles{0};
  std::uint64_t promotions{0};
  std::uint64_t checks{0};
  std::uint64_t checkmates{0};

  PerftStats& operator+=(const PerftStats& other);
};

std::uint64_t perft(Position& pos, int depth);

/// Per-root-move leaf counts at depth - 1, in generation order.
std::vector<std::pair<Move, std::uint64_t>> perft_divide(Position& pos, int depth);

/// Like perft but classifies each leaf move. Slower: every leaf is played.
PerftStats perft_stats(Position& pos, int depth);

}  // namespace gambit
