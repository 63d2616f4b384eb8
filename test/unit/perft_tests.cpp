#include "perft.h"

#include <catch2/catch.hpp>
#include <numeric>
#include <vector>

namespace gambit::test {

TEST_CASE("Perft start position small depths", "[perft]") {
  Position pos = Position::from_fen(kStartFen, true);
  REQUIRE(perft(pos, 1) == 20ULL);
  REQUIRE(perft(pos, 2) == 400ULL);
  REQUIRE(perft(pos, 3) == 8902ULL);
  REQUIRE(perft(pos, 4) == 197281ULL);
}

TEST_CASE("Perft reference suite matches expected counts", "[perft][reference]") {
  struct Entry {
    const char* fen;
    std::vector<std::pair<int, std::uint64_t>> expectations;
  };

  const std::vector<Entry> entries = {
      {"r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1",
       {{1, 48}, {2, 2039}, {3, 97862}}},
      {"8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1",
       {{1, 14}, {2, 191}, {3, 2812}, {4, 43238}}},
      {"r3k2r/Pppp1ppp/1b3nbN/nP6/BBP1P3/q4N2/Pp1P2PP/R2Q1RK1 w kq - 0 1",
       {{1, 6}, {2, 264}, {3, 9467}}},
      {"rnbq1k1r/pp1Pbppp/2p5/8/2B5/8/PPP1NnPP/RNBQK2R w KQ - 1 8",
       {{1, 44}, {2, 1486}, {3, 62379}}},
      {"r4rk1/1pp1qppp/p1np1n2/2b1p1B1/2B1P1b1/P1NP1N2/1PP1QPPP/R4RK1 w - - 0 10",
       {{1, 46}, {2, 2079}, {3, 89890}}}};

  for (const auto& entry : entries) {
    INFO("FEN=" << entry.fen);
    const Position base = Position::from_fen(entry.fen, true);
    for (const auto& [depth, expected] : entry.expectations) {
      Position pos = base;
      INFO("depth=" << depth);
      REQUIRE(perft(pos, depth) == expected);
      REQUIRE(pos.to_fen() == base.to_fen());
    }
  }
}

TEST_CASE("Perft divide sums to the full count", "[perft]") {
  Position pos = Position::from_fen(kStartFen, true);
  const auto split = perft_divide(pos, 3);
  REQUIRE(split.size() == 20);
  const std::uint64_t total =
      std::accumulate(split.begin(), split.end(), std::uint64_t{0},
                      [](std::uint64_t acc, const auto& entry) { return acc + entry.second; });
  REQUIRE(total == 8902ULL);
  REQUIRE(perft_divide(pos, 0).empty());
}

TEST_CASE("Perft stats classify leaf moves", "[perft]") {
  Position start = Position::from_fen(kStartFen);
  const PerftStats opening = perft_stats(start, 3);
  REQUIRE(opening.nodes == 8902ULL);
  REQUIRE(opening.captures == 34ULL);
  REQUIRE(opening.checks == 12ULL);
  REQUIRE(opening.checkmates == 0ULL);

  Position kiwipete =
      Position::from_fen("r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1");
  const PerftStats tactical = perft_stats(kiwipete, 2);
  REQUIRE(tactical.nodes == 2039ULL);
  REQUIRE(tactical.captures == 351ULL);
  REQUIRE(tactical.en_passant == 1ULL);
  REQUIRE(tactical.castles == 91ULL);
  REQUIRE(tactical.promotions == 0ULL);
  REQUIRE(tactical.checks == 3ULL);

  Position endgame = Position::from_fen("8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1");
  const PerftStats rooks = perft_stats(endgame, 3);
  REQUIRE(rooks.nodes == 2812ULL);
  REQUIRE(rooks.captures == 209ULL);
  REQUIRE(rooks.en_passant == 2ULL);
  REQUIRE(rooks.checks == 267ULL);
}

}  // namespace gambit::test
