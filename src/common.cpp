#include "common.h"

#include <array>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace gambit {

namespace {
constexpr std::array<char, 13> kPieceChars = {
    '.', 'P', 'N', 'B', 'R', 'Q', 'K', 'p', 'n', 'b', 'r', 'q', 'k'};
}

std::string format_score(Score s) {
  if (!is_mate_score(s)) {
    return "cp " + std::to_string(s);
  }
  const int plies = kMateValue - (s < 0 ? -s : s);
  const int moves = (plies + 1) / 2;
  return "mate " + std::to_string(s < 0 ? -moves : moves);
}

std::string square_to_string(Square sq) {
  if (sq == Square::None) {
    return "--";
  }
  const char file = static_cast<char>('a' + static_cast<int>(file_of(sq)));
  const char rank = static_cast<char>('1' + static_cast<int>(rank_of(sq)));
  return std::string{file, rank};
}

Square square_from_string(std::string_view token) {
  if (token.size() < 2) {
    return Square::None;
  }
  const char file_char = static_cast<char>(std::tolower(static_cast<unsigned char>(token[0])));
  const char rank_char = token[1];
  if (file_char < 'a' || file_char > 'h' || rank_char < '1' || rank_char > '8') {
    return Square::None;
  }
  return make_square(file_char - 'a', rank_char - '1');
}

char piece_to_char(Piece pc) {
  return kPieceChars[static_cast<std::uint8_t>(pc)];
}

Piece piece_from_char(char c) {
  for (std::size_t idx = 1; idx < kPieceChars.size(); ++idx) {
    if (kPieceChars[idx] == c) {
      return static_cast<Piece>(idx);
    }
  }
  return Piece::None;
}

namespace detail {

[[noreturn]] void gambit_trap(const char* expr, const char* file, int line) {
  std::cerr << "gambit assertion failed: " << expr << " (" << file << ':' << line << ")\n";
  std::abort();
}

}  // namespace detail

}  // namespace gambit
