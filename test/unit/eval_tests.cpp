#include "eval.h"

#include <catch2/catch.hpp>
#include <array>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <string>
#include <string_view>

namespace gambit::test {

namespace {

// Flips the board top to bottom, swaps piece colours and the side to move.
std::string mirror_fen(std::string_view fen) {
  std::array<std::string, 6> fields{};
  std::istringstream iss{std::string(fen)};
  for (std::string& field : fields) {
    iss >> field;
  }

  std::array<char, 64> squares{};
  squares.fill('.');
  int rank = 7;
  int file = 0;
  for (char ch : fields[0]) {
    if (ch == '/') {
      --rank;
      file = 0;
    } else if (std::isdigit(static_cast<unsigned char>(ch))) {
      file += ch - '0';
    } else {
      squares[rank * 8 + file++] = ch;
    }
  }

  auto swap_case = [](char ch) {
    return std::islower(static_cast<unsigned char>(ch))
               ? static_cast<char>(std::toupper(static_cast<unsigned char>(ch)))
               : static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  };

  std::ostringstream board;
  for (int r = 7; r >= 0; --r) {
    int empty = 0;
    for (int f = 0; f < 8; ++f) {
      const char piece = squares[(7 - r) * 8 + f];
      if (piece == '.') {
        ++empty;
        continue;
      }
      if (empty != 0) {
        board << empty;
        empty = 0;
      }
      board << swap_case(piece);
    }
    if (empty != 0) {
      board << empty;
    }
    if (r != 0) {
      board << '/';
    }
  }

  std::string castling;
  for (const char ch : {'k', 'q', 'K', 'Q'}) {
    if (fields[2].find(ch) != std::string::npos) {
      castling += swap_case(ch);
    }
  }
  if (castling.empty()) {
    castling = "-";
  }
  std::string ep = fields[3];
  if (ep.size() == 2) {
    ep[1] = static_cast<char>('9' - (ep[1] - '0'));
  }

  std::ostringstream out;
  out << board.str() << ' ' << (fields[1] == "w" ? 'b' : 'w') << ' ' << castling << ' ' << ep
      << ' ' << fields[4] << ' ' << fields[5];
  return out.str();
}

EvalConfig quiet_config() {
  EvalConfig config;
  config.tactical_weighting = false;
  return config;
}

}  // namespace

TEST_CASE("Start position evaluates level", "[eval]") {
  const Position pos = Position::from_fen(kStartFen);
  EvalTrace trace{};
  const Score score = evaluate(pos, quiet_config(), &trace);

  REQUIRE(score == 0);
  REQUIRE(trace.total == score);
  REQUIRE_FALSE(trace.terminal);
  REQUIRE(trace.phase == GamePhase::Opening);
  REQUIRE(trace.material[0] == 3900);
  REQUIRE(trace.material[1] == 3900);
  REQUIRE(trace.king_safety[0] == trace.king_safety[1]);
  REQUIRE(trace.tactical[0] == 0);
  REQUIRE(trace.tactical[1] == 0);
}

TEST_CASE("Colour-flipped mirror negates evaluation", "[eval]") {
  constexpr std::array<std::string_view, 3> kFens = {
      "r1bqk2r/pppp1ppp/2n2n2/2b1p3/2B1P3/3P1N2/PPP2PPP/RNBQK2R w KQkq - 0 12",
      "r2q1rk1/pp3ppp/2n5/3p4/3P4/2N2B2/PP3PPP/R2Q1RK1 b - - 0 18",
      "8/5pk1/6p1/8/3R4/6P1/5PK1/8 w - - 0 40",
  };
  for (const std::string_view fen : kFens) {
    INFO("fen=" << fen);
    const Position original = Position::from_fen(fen);
    const std::string mirrored_fen = mirror_fen(fen);
    INFO("mirrored=" << mirrored_fen);
    const Position mirrored = Position::from_fen(mirrored_fen);
    REQUIRE(evaluate(mirrored, quiet_config()) == -evaluate(original, quiet_config()));
  }
}

TEST_CASE("Mirror stays symmetric with tactical weighting on", "[eval]") {
  constexpr Score kTacticalTolerance = 50;
  constexpr std::array<std::string_view, 3> kFens = {
      "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1",
      "r1bqk2r/pppp1ppp/2n2n2/2b1p3/2B1P3/3P1N2/PPP2PPP/RNBQK2R w KQkq - 0 12",
      "r2q1rk1/pp3ppp/2n5/3p4/3P4/2N2B2/PP3PPP/R2Q1RK1 b - - 0 18",
  };
  const EvalConfig config{};
  REQUIRE(config.tactical_weighting);
  for (const std::string_view fen : kFens) {
    INFO("fen=" << fen);
    const Position original = Position::from_fen(fen);
    const Position mirrored = Position::from_fen(mirror_fen(fen));
    EvalTrace forward{};
    EvalTrace flipped{};
    const Score score = evaluate(original, config, &forward);
    const Score mirror_score = evaluate(mirrored, config, &flipped);
    INFO("score=" << score << " mirror=" << mirror_score);
    REQUIRE(std::abs(score + mirror_score) <= kTacticalTolerance);
    REQUIRE(std::abs(forward.tactical[0] - flipped.tactical[1]) <= kTacticalTolerance);
    REQUIRE(std::abs(forward.tactical[1] - flipped.tactical[0]) <= kTacticalTolerance);
  }
}

TEST_CASE("Terminal positions bypass the heuristic terms", "[eval]") {
  EvalTrace trace{};
  const Position black_mated = Position::from_fen("R5k1/5ppp/8/8/8/8/5PPP/6K1 b - - 1 1");
  REQUIRE(evaluate(black_mated, &trace) == kMateValue);
  REQUIRE(trace.terminal);

  const Position white_mated = Position::from_fen("6k1/8/8/8/8/8/5PPP/r5K1 w - - 1 1");
  REQUIRE(evaluate(white_mated) == -kMateValue);

  const Position stalemate = Position::from_fen("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
  REQUIRE(evaluate(stalemate) == kDrawScore);

  const Position bare = Position::from_fen("4k3/8/8/8/8/8/3N4/4K3 w - - 0 1");
  REQUIRE(evaluate(bare, &trace) == kDrawScore);
  REQUIRE(trace.terminal);

  const Position fifty = Position::from_fen("4k3/8/8/8/8/8/4R3/4K3 w - - 100 80");
  REQUIRE(evaluate(fifty) == kDrawScore);
}

TEST_CASE("Position without a king evaluates to zero", "[eval]") {
  const Position pos = Position::from_fen("8/8/8/8/8/8/4P3/4K3 w - - 0 1", false);
  EvalTrace trace{};
  REQUIRE(evaluate(pos, &trace) == kInvalidPositionScore);
  REQUIRE(trace.terminal);
}

TEST_CASE("Non-terminal scores stay below the mate band", "[eval]") {
  const Position pos =
      Position::from_fen("7k/6pp/8/8/8/8/QQQQQQQQ/QQQQQQK1 w - - 0 40");
  const Score score = evaluate(pos, quiet_config());
  REQUIRE(score == kMateThreshold - 1);
  REQUIRE_FALSE(is_mate_score(score));
}

TEST_CASE("Game phase follows material and move count", "[eval]") {
  REQUIRE(game_phase(Position::from_fen(kStartFen)) == GamePhase::Opening);
  REQUIRE(game_phase(Position::from_fen("4k3/8/8/8/8/8/4P3/4K3 w - - 0 1")) ==
          GamePhase::Endgame);
  REQUIRE(game_phase(Position::from_fen(
              "r2q1rk1/pp3ppp/2n5/8/8/2N5/PP3PPP/R2Q1RK1 w - - 0 30")) ==
          GamePhase::Middlegame);
  REQUIRE(phase_name(GamePhase::Middlegame) == "middlegame");
}

TEST_CASE("Tactical term rewards a mating threat", "[eval]") {
  const Position pos = Position::from_fen("6k1/5ppp/8/8/8/8/5PPP/R5K1 w - - 0 1");
  EvalConfig config;
  config.tactical_move_prefix = 64;
  REQUIRE(tactical_score(pos, Color::White, config) >= 2500);

  config.tactical_weighting = false;
  REQUIRE(tactical_score(pos, Color::White, config) == 0);
}

TEST_CASE("Side not to move is scored only through a legal pass", "[eval]") {
  // White is in check, so Black's threats cannot be read by passing.
  const Position checked = Position::from_fen("4k3/8/8/8/8/8/8/R3K2r w - - 0 1");
  REQUIRE(tactical_score(checked, Color::Black, EvalConfig{}) == 0);

  const Position pos = Position::from_fen("6k1/5ppp/8/8/8/8/5PPP/R5K1 b - - 0 1");
  EvalConfig config;
  config.tactical_move_prefix = 64;
  REQUIRE(tactical_score(pos, Color::White, config) >= 2500);
  config.null_move_threats = false;
  REQUIRE(tactical_score(pos, Color::White, config) == 0);
}

}  // namespace gambit::test
