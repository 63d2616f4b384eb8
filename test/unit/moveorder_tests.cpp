#include "moveorder.h"

#include "motifs.h"

#include <catch2/catch.hpp>
#include <string_view>

namespace gambit::test {

namespace {

int expected_priority(const Position& pos, Move move, int capture_units) {
  int priority = analyze(pos, move).total() + capture_units * kCaptureUnitBonus;
  if (pos.gives_check(move)) {
    priority += kCheckBonus;
  }
  if (is_promotion_flag(move_flag(move))) {
    priority += kPromotionBonus;
  }
  if (pos.is_castling(move)) {
    priority += kCastlingBonus;
  }
  return priority;
}

}  // namespace

TEST_CASE("Equal priorities keep generator order", "[moveorder]") {
  const Position pos = Position::from_fen(kStartFen);
  MoveList moves;
  pos.generate_moves(moves, GenStage::All);
  REQUIRE(moves.size() == 20);
  for (const Move move : moves) {
    REQUIRE(move_priority(pos, move) == 0);
  }

  MoveList ordered = moves;
  order_moves(pos, ordered);
  REQUIRE(ordered.size() == moves.size());
  for (std::size_t idx = 0; idx < moves.size(); ++idx) {
    REQUIRE(ordered[idx] == moves[idx]);
  }
}

TEST_CASE("Captures are searched before quiet moves", "[moveorder]") {
  const Position pos = Position::from_fen("4k3/8/8/3p4/4P3/8/8/4K3 w - - 0 1");
  MoveList moves;
  pos.generate_moves(moves, GenStage::All);
  order_moves(pos, moves);
  REQUIRE(moves[0] == parse_uci_move(pos, "e4d5"));
  REQUIRE(move_priority(pos, moves[0]) > move_priority(pos, parse_uci_move(pos, "e4e5")));
}

TEST_CASE("Priority adds capture, check, promotion and castling bonuses", "[moveorder]") {
  const Position capture = Position::from_fen("4k3/8/8/3r4/4P3/8/8/4K3 w - - 0 1");
  const Move takes_rook = parse_uci_move(capture, "e4d5");
  REQUIRE(move_priority(capture, takes_rook) == expected_priority(capture, takes_rook, 5));

  const Position mate = Position::from_fen("6k1/5ppp/8/8/8/8/5PPP/R5K1 w - - 0 1");
  const Move rook_mate = parse_uci_move(mate, "a1a8");
  REQUIRE(mate.gives_check(rook_mate));
  REQUIRE(move_priority(mate, rook_mate) == expected_priority(mate, rook_mate, 0));
  REQUIRE(move_priority(mate, rook_mate) >= kMateInOneMagnitude + kCheckBonus);

  const Position promo = Position::from_fen("4k3/P7/8/8/8/8/8/4K3 w - - 0 1");
  const Move queen = parse_uci_move(promo, "a7a8q");
  const Move knight = parse_uci_move(promo, "a7a8n");
  REQUIRE(move_priority(promo, queen) == expected_priority(promo, queen, 0));
  REQUIRE(move_priority(promo, queen) >= kPromotionBonus);
  REQUIRE(move_priority(promo, knight) >= kPromotionBonus);

  const Position castle = Position::from_fen("r3k2r/pppppppp/8/8/8/8/PPPPPPPP/R3K2R w KQkq - 0 1");
  const Move short_castle = parse_uci_move(castle, "e1g1");
  REQUIRE(move_priority(castle, short_castle) == expected_priority(castle, short_castle, 0));
  REQUIRE(move_priority(castle, short_castle) >= kCastlingBonus);
}

TEST_CASE("Hoisted move is placed first", "[moveorder]") {
  const Position pos = Position::from_fen("4k3/8/8/3p4/4P3/8/8/4K3 w - - 0 1");
  MoveList moves;
  pos.generate_moves(moves, GenStage::All);
  const std::size_t count = moves.size();
  const Move king_step = parse_uci_move(pos, "e1d1");
  REQUIRE_FALSE(king_step.is_null());

  order_moves(pos, moves, king_step);
  REQUIRE(moves.size() == count);
  REQUIRE(moves[0] == king_step);
  REQUIRE(moves[1] == parse_uci_move(pos, "e4d5"));
}

TEST_CASE("Hoist outside the list is ignored", "[moveorder]") {
  const Position pos = Position::from_fen(kStartFen);
  MoveList moves;
  pos.generate_moves(moves, GenStage::All);
  MoveList plain = moves;
  order_moves(pos, plain);
  order_moves(pos, moves, make_move(Square::E2, Square::E5));
  for (std::size_t idx = 0; idx < moves.size(); ++idx) {
    REQUIRE(moves[idx] == plain[idx]);
  }
}

}  // namespace gambit::test
