#include "book.h"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "debug.h"

namespace gambit {
namespace {

struct RepertoireLine {
  std::string_view name;
  std::string_view moves;
};

constexpr RepertoireLine kRepertoire[] = {
    {"London System", "d2d4 d7d5 g1f3 g8f6 c1f4 e7e6 e2e3"},
    {"Vienna Game", "e2e4 e7e5 b1c3 g8f6 f2f4"},
    {"Ruy Lopez", "e2e4 e7e5 g1f3 b8c6 f1b5"},
    {"Italian Game", "e2e4 e7e5 g1f3 b8c6 f1c4"},
    {"Caro-Kann Defense", "e2e4 c7c6 d2d4 d7d5"},
    {"Scandinavian Defense", "e2e4 d7d5 e4d5 d8d5 b1c3"},
    {"Queen's Gambit Declined", "d2d4 d7d5 c2c4 e7e6"},
    {"Nimzo-Indian Defense", "d2d4 g8f6 c2c4 e7e6 b1c3 f8b4"},
};

}  // namespace

void LineBook::add_line(std::string_view name, std::string_view uci_moves) {
  const std::size_t line_index = names_.size();
  names_.emplace_back(name);

  Position pos = Position::from_fen(kStartFen);
  std::istringstream iss{std::string(uci_moves)};
  std::string token;
  int ply = 0;
  while (iss >> token && ply < kMaxBookPly) {
    const Move move = parse_uci_move(pos, token);
    if (move.is_null()) {
      throw std::runtime_error("Book line '" + std::string(name) + "': illegal move " + token);
    }
    continuations_.try_emplace(pos.zobrist(), move);
    Undo undo;
    pos.make(move, undo);
    reached_by_.try_emplace(pos.zobrist(), line_index);
    ++ply;
  }
}

Move LineBook::probe(const Position& pos) const {
  if (pos.game_ply() >= kMaxBookPly) {
    return Move{};
  }
  const auto it = continuations_.find(pos.zobrist());
  if (it == continuations_.end()) {
    return Move{};
  }
  MoveList legal;
  pos.generate_moves(legal, GenStage::All);
  if (!legal.contains(it->second)) {
    return Move{};
  }
  if (trace_enabled(TraceTopic::Book)) {
    std::ostringstream oss;
    oss << "hit move=" << move_to_uci(it->second);
    if (const auto name = opening_name(pos)) {
      oss << " line=\"" << *name << '"';
    }
    trace_emit(TraceTopic::Book, oss.str());
  }
  return it->second;
}

std::optional<std::string_view> LineBook::opening_name(const Position& pos) const {
  const auto it = reached_by_.find(pos.zobrist());
  if (it == reached_by_.end()) {
    return std::nullopt;
  }
  return std::string_view{names_[it->second]};
}

const LineBook& LineBook::default_repertoire() {
  static const LineBook book = [] {
    LineBook built;
    for (const RepertoireLine& line : kRepertoire) {
      built.add_line(line.name, line.moves);
    }
    return built;
  }();
  return book;
}

}  // namespace gambit
