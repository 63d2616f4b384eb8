#include "debug.h"
#include "search.h"
#include "searchparams.h"

#include <catch2/catch.hpp>
#include <algorithm>
#include <array>
#include <atomic>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::vector<std::string>* g_trace_sink = nullptr;

void capture_trace(gambit::TraceTopic, std::string_view payload) {
  if (g_trace_sink) {
    g_trace_sink->emplace_back(payload);
  }
}

}  // namespace

namespace gambit::test {

namespace {

Limits fixed_depth(int depth) {
  Limits limits;
  limits.depth = static_cast<std::int16_t>(depth);
  limits.adaptive_depth = false;
  return limits;
}

bool is_legal_at(const Position& pos, Move move) {
  MoveList moves;
  pos.generate_moves(moves, GenStage::All);
  return moves.contains(move);
}

}  // namespace

TEST_CASE("Search trace toggles respect topic flag", "[search][trace]") {
  std::vector<std::string> payloads;
  g_trace_sink = &payloads;
  set_trace_writer(&capture_trace);

  const Position base = Position::from_fen(kStartFen);
  const Limits limits = fixed_depth(1);

  set_trace_topic(TraceTopic::Search, false);
  {
    Position pos = base;
    (void)search(pos, limits);
  }
  REQUIRE(payloads.empty());

  set_trace_topic(TraceTopic::Search, true);
  {
    Position pos = base;
    const SearchResult result = search(pos, limits);
    REQUIRE_FALSE(result.best.is_null());
    REQUIRE(result.depth == 1);
  }
  REQUIRE(payloads.size() >= 3);
  REQUIRE(payloads.front().find("trace search start") != std::string::npos);
  REQUIRE(payloads.front().find("pruning=on") != std::string::npos);
  REQUIRE(payloads.back().find("trace search finish") != std::string::npos);
  REQUIRE(std::any_of(payloads.begin(), payloads.end(), [](const std::string& line) {
    return line.find("trace search iteration depth=1") != std::string::npos;
  }));

  set_trace_topic(TraceTopic::Search, false);
  set_trace_writer(nullptr);
  g_trace_sink = nullptr;
}

TEST_CASE("Search finds mate in one", "[search]") {
  Position pos = Position::from_fen("6k1/5ppp/8/8/8/8/5PPP/R5K1 w - - 0 1");
  const SearchResult result = search(pos, fixed_depth(2));
  REQUIRE(move_to_uci(result.best) == "a1a8");
  REQUIRE(result.eval >= kMateThreshold);
  REQUIRE(result.eval == kMateValue - 1);
  REQUIRE_FALSE(result.pv.line.empty());
  REQUIRE(result.pv.line.front() == result.best);
  REQUIRE(format_score(result.eval) == "mate 1");
}

TEST_CASE("Scores format as centipawns or moves to mate", "[search]") {
  REQUIRE(format_score(35) == "cp 35");
  REQUIRE(format_score(-kMateThreshold + 1) == "cp -8999");
  REQUIRE(format_score(kMateValue - 3) == "mate 2");
  REQUIRE(format_score(-(kMateValue - 2)) == "mate -1");
}

TEST_CASE("Black mate is reported White-negative", "[search]") {
  Position pos = Position::from_fen("r5k1/8/8/8/8/8/5PPP/6K1 b - - 0 1");
  const SearchResult result = search(pos, fixed_depth(2));
  REQUIRE(move_to_uci(result.best) == "a8a1");
  REQUIRE(result.eval <= -kMateThreshold);
}

TEST_CASE("Search captures a hanging queen", "[search]") {
  Position pos = Position::from_fen("4k3/8/8/3q4/4P3/8/8/4K3 w - - 0 1");
  const SearchResult result = search(pos, fixed_depth(2));
  REQUIRE(move_to_uci(result.best) == "e4d5");
  REQUIRE(result.eval > 0);
}

TEST_CASE("Roots without a move to search", "[search]") {
  Position mated = Position::from_fen("R5k1/5ppp/8/8/8/8/5PPP/6K1 b - - 1 1");
  const SearchResult mate_result = search(mated, fixed_depth(2));
  REQUIRE(mate_result.best.is_null());
  REQUIRE(mate_result.eval == kMateValue);

  Position stalemate = Position::from_fen("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
  const SearchResult stale_result = search(stalemate, fixed_depth(2));
  REQUIRE(stale_result.best.is_null());
  REQUIRE(stale_result.eval == kDrawScore);

  Position kingless = Position::from_fen("8/8/8/8/8/8/4P3/4K3 w - - 0 1", false);
  const SearchResult invalid = search(kingless, fixed_depth(2));
  REQUIRE(invalid.best.is_null());
  REQUIRE(invalid.eval == kInvalidPositionScore);
}

TEST_CASE("Drawn root still returns a move scored as a draw", "[search]") {
  Position pos = Position::from_fen("4k3/8/8/8/8/8/3N4/4K3 w - - 0 1");
  const SearchResult result = search(pos, fixed_depth(2));
  REQUIRE_FALSE(result.best.is_null());
  REQUIRE(is_legal_at(pos, result.best));
  REQUIRE(result.eval == kDrawScore);
}

TEST_CASE("Pruning does not change the minimax answer", "[search]") {
  constexpr std::array<std::string_view, 3> kFens = {
      "4k3/8/8/3p4/4P3/8/8/4K3 w - - 0 1",
      "4k3/4p3/8/3r4/4P3/2N5/8/4K3 w - - 0 1",
      "6k1/5ppp/8/8/8/8/5PPP/R5K1 b - - 0 1",
  };
  for (const std::string_view fen : kFens) {
    INFO("fen=" << fen);
    Limits pruned = fixed_depth(2);
    pruned.eval.tactical_weighting = false;
    Limits full = pruned;
    full.enable_pruning = false;

    Position a = Position::from_fen(fen);
    Position b = Position::from_fen(fen);
    const SearchResult with_pruning = search(a, pruned);
    const SearchResult without_pruning = search(b, full);
    REQUIRE(with_pruning.eval == without_pruning.eval);
    REQUIRE(with_pruning.best == without_pruning.best);
    REQUIRE(with_pruning.nodes <= without_pruning.nodes);
  }
}

TEST_CASE("Search restores the root position", "[search]") {
  Position pos = Position::from_fen(
      "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1");
  const std::string before = pos.to_fen();
  const std::uint64_t key = pos.zobrist();
  Limits limits = fixed_depth(2);
  limits.eval.tactical_weighting = false;
  const SearchResult result = search(pos, limits);
  REQUIRE(pos.to_fen() == before);
  REQUIRE(pos.zobrist() == key);
  REQUIRE(is_legal_at(pos, result.best));
}

TEST_CASE("Time-boxed search respects its budget", "[search]") {
  Position pos = Position::from_fen(
      "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1");
  const SearchResult result = search(pos, std::chrono::milliseconds(200));
  REQUIRE_FALSE(result.best.is_null());
  REQUIRE(is_legal_at(pos, result.best));
  // Each node polls the clock, so the overrun is bounded by one evaluation.
  REQUIRE(result.elapsed_ms <= 200 + 50);
}

TEST_CASE("Node cap aborts and keeps a legal answer", "[search]") {
  Position pos = Position::from_fen(kStartFen);
  Limits limits = fixed_depth(5);
  limits.nodes = 200;
  limits.eval.tactical_weighting = false;
  const SearchResult result = search(pos, limits);
  REQUIRE(result.aborted);
  REQUIRE(result.depth < 5);
  REQUIRE(is_legal_at(pos, result.best));
}

TEST_CASE("Pre-set stop flag still yields a legal move", "[search]") {
  Position pos = Position::from_fen(kStartFen);
  std::atomic<bool> stop{true};
  const SearchResult result = search(pos, fixed_depth(3), nullptr, &stop);
  REQUIRE(result.aborted);
  REQUIRE(result.depth == 0);
  REQUIRE(is_legal_at(pos, result.best));
  REQUIRE(result.pv.line.size() == 1);
}

TEST_CASE("Progress callback sees every completed iteration", "[search]") {
  Position pos = Position::from_fen("4k3/8/8/3p4/4P3/8/8/4K3 w - - 0 1");
  std::vector<int> depths;
  const SearchProgressFn progress = [&depths](const SearchResult& r) { depths.push_back(r.depth); };
  const SearchResult result = search(pos, fixed_depth(3), nullptr, nullptr, &progress);
  REQUIRE(depths == std::vector<int>{1, 2, 3});
  REQUIRE(result.depth == 3);
}

TEST_CASE("Book move is played without searching", "[search][book]") {
  Position pos = Position::from_fen(kStartFen);
  const SearchResult result = search(pos, fixed_depth(3), &LineBook::default_repertoire());
  REQUIRE(result.from_book);
  REQUIRE(move_to_uci(result.best) == "d2d4");
  REQUIRE(result.depth == 0);

  Limits no_book = fixed_depth(1);
  no_book.use_book = false;
  const SearchResult searched = search(pos, no_book, &LineBook::default_repertoire());
  REQUIRE_FALSE(searched.from_book);
  REQUIRE(searched.depth == 1);
}

TEST_CASE("Depth selection", "[search]") {
  const Position start = Position::from_fen(kStartFen);
  Limits limits;
  REQUIRE(select_depth(start, limits) == kDefaultSearchDepth);
  limits.depth = 2;
  limits.adaptive_depth = false;
  REQUIRE(select_depth(start, limits) == 2);

  // Boxed king with the rook on an open file: every move carries a heavy motif.
  const Position forcing = Position::from_fen("6k1/5ppp/8/8/8/8/5PPP/R5K1 w - - 0 1");
  Limits adaptive;
  adaptive.depth = 2;
  REQUIRE(select_depth(forcing, adaptive) == 3);
  adaptive.adaptive_depth = false;
  REQUIRE(select_depth(forcing, adaptive) == 2);
}

TEST_CASE("Forcing moves deep in the move list deepen the search", "[search]") {
  // Sixteen quiet pawn, knight and bishop moves come first; the captures and
  // checks of both queens follow them.
  const Position pos = Position::from_fen("7k/8/nQ1ppp2/3pQp2/3ppp2/8/PPP5/5BNK w - - 0 1");
  MoveList moves;
  pos.generate_moves(moves, GenStage::All);
  int forcing = 0;
  for (std::size_t idx = 0; idx < moves.size(); ++idx) {
    const bool is_forcing = pos.is_capture(moves[idx]) || pos.gives_check(moves[idx]);
    if (idx < 15) {
      INFO("move=" << move_to_uci(moves[idx]));
      REQUIRE_FALSE(is_forcing);
    }
    forcing += is_forcing ? 1 : 0;
  }
  REQUIRE(forcing >= 12);

  Limits limits;
  limits.depth = 2;
  REQUIRE(select_depth(pos, limits) == 3);
}

}  // namespace gambit::test
