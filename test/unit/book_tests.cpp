#include "book.h"
#include "debug.h"

#include <catch2/catch.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::vector<std::string>* g_book_sink = nullptr;

void capture_book_trace(gambit::TraceTopic, std::string_view payload) {
  if (g_book_sink) {
    g_book_sink->emplace_back(payload);
  }
}

}  // namespace

namespace gambit::test {

namespace {

Position play(std::string_view uci_moves) {
  Position pos = Position::from_fen(kStartFen);
  std::istringstream iss{std::string(uci_moves)};
  std::string token;
  while (iss >> token) {
    const Move move = parse_uci_move(pos, token);
    REQUIRE_FALSE(move.is_null());
    Undo undo;
    pos.make(move, undo);
  }
  return pos;
}

}  // namespace

TEST_CASE("Default repertoire covers the main first moves", "[book]") {
  const LineBook& book = LineBook::default_repertoire();
  REQUIRE_FALSE(book.empty());

  REQUIRE(move_to_uci(book.probe(play(""))) == "d2d4");
  REQUIRE(move_to_uci(book.probe(play("e2e4"))) == "e7e5");
  REQUIRE(move_to_uci(book.probe(play("e2e4 e7e5 g1f3"))) == "b8c6");
  REQUIRE(move_to_uci(book.probe(play("e2e4 c7c6"))) == "d2d4");
  REQUIRE(move_to_uci(book.probe(play("d2d4 g8f6"))) == "c2c4");
}

TEST_CASE("Positions off the book return no move", "[book]") {
  const LineBook& book = LineBook::default_repertoire();
  REQUIRE(book.probe(play("a2a3")).is_null());
  REQUIRE(book.probe(play("e2e4 e7e5 g1f3 b8c6 f1b5")).is_null());
  REQUIRE(book.probe(Position::from_fen("4k3/8/8/8/8/8/4P3/4K3 w - - 0 1")).is_null());
}

TEST_CASE("Opening names follow the line that reached the position", "[book]") {
  const LineBook& book = LineBook::default_repertoire();
  REQUIRE(book.opening_name(play("e2e4 e7e5 g1f3 b8c6 f1b5")) == "Ruy Lopez");
  REQUIRE(book.opening_name(play("e2e4 e7e5 g1f3 b8c6 f1c4")) == "Italian Game");
  REQUIRE(book.opening_name(play("d2d4 d7d5 c2c4 e7e6")) == "Queen's Gambit Declined");
  REQUIRE_FALSE(book.opening_name(play("a2a3")).has_value());
}

TEST_CASE("Custom lines are replayed and validated", "[book]") {
  LineBook book;
  REQUIRE(book.empty());
  book.add_line("English Opening", "c2c4 e7e5 b1c3");
  REQUIRE(book.size() == 3);
  REQUIRE(move_to_uci(book.probe(play(""))) == "c2c4");
  REQUIRE(move_to_uci(book.probe(play("c2c4 e7e5"))) == "b1c3");

  REQUIRE_THROWS_AS(book.add_line("Broken", "e2e4 e2e4"), std::runtime_error);
}

TEST_CASE("Book stops answering past its ply horizon", "[book]") {
  LineBook book;
  book.add_line("Knight shuffle",
                "g1f3 g8f6 f3g1 f6g8 g1f3 g8f6 f3g1 f6g8 g1f3 g8f6 f3g1 f6g8 g1f3 g8f6 f3g1 f6g8");
  // The start position recurs after every four plies, so the same key maps
  // to the same continuation; past the horizon the probe stays silent.
  Position late = play("g1f3 g8f6 f3g1 f6g8 g1f3 g8f6 f3g1 f6g8 g1f3 g8f6 f3g1 f6g8 g1f3 g8f6 f3g1 f6g8");
  REQUIRE(late.game_ply() >= LineBook::kMaxBookPly);
  REQUIRE(book.probe(late).is_null());
  REQUIRE(move_to_uci(book.probe(play(""))) == "g1f3");
}

TEST_CASE("Book hits are traced", "[book][trace]") {
  std::vector<std::string> payloads;
  g_book_sink = &payloads;
  set_trace_writer(&capture_book_trace);
  set_trace_topic(TraceTopic::Book, true);

  (void)LineBook::default_repertoire().probe(play("e2e4 e7e5 g1f3"));

  set_trace_topic(TraceTopic::Book, false);
  set_trace_writer(nullptr);
  g_book_sink = nullptr;

  REQUIRE(payloads.size() == 1);
  REQUIRE(payloads.front().find("trace book hit move=b8c6") != std::string::npos);
}

}  // namespace gambit::test
