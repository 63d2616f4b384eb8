#pragma once
// board.h -- Chess position representation with make/unmake operations.
// Maintains bitboards, FEN parsing/serialization, legal move generation and
// the attack/terminal queries the search core consumes.

#include <array>
#include <string>
#include <string_view>

#include "common.h"

namespace gambit {

enum CastlingRights : std::uint8_t {
  CastleNone = 0,
  CastleWK = 1 << 0,
  CastleWQ = 1 << 1,
  CastleBK = 1 << 2,
  CastleBQ = 1 << 3
};

inline constexpr std::string_view kStartFen =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

class Position {
public:
  Position();

  /// Parses a FEN string. Throws std::runtime_error on malformed input; with
  /// strict=false unknown castling/en-passant tokens are ignored.
  static Position from_fen(std::string_view fen, bool strict = true);
  std::string to_fen() const;

  [[nodiscard]] Color side_to_move() const { return side_; }
  [[nodiscard]] Bitboard occupancy() const { return occupied_all_; }
  [[nodiscard]] Bitboard occupancy(Color c) const { return occupied_[color_index(c)]; }
  [[nodiscard]] Bitboard pieces(Color color, PieceType type) const;
  [[nodiscard]] Piece piece_on(Square sq) const { return squares_[static_cast<int>(sq)]; }
  [[nodiscard]] Square king_square(Color color) const { return kings_[color_index(color)]; }
  [[nodiscard]] std::uint8_t castling_rights() const { return castling_; }
  [[nodiscard]] Square en_passant_square() const { return ep_square_; }
  [[nodiscard]] std::uint8_t halfmove_clock() const { return halfmove_clock_; }
  [[nodiscard]] std::uint16_t fullmove_number() const { return fullmove_number_; }
  [[nodiscard]] int game_ply() const;
  [[nodiscard]] std::uint64_t zobrist() const { return zobrist_; }
  [[nodiscard]] std::uint64_t compute_zobrist() const;

  /// Structural consistency check; fills reason on failure.
  bool is_sane(std::string* reason = nullptr) const;
  [[nodiscard]] bool has_both_kings() const;

  [[nodiscard]] bool in_check(Color color) const;
  [[nodiscard]] bool in_check() const { return in_check(side_); }
  [[nodiscard]] bool is_square_attacked(Square sq, Color by) const;
  /// Pieces of color `by` attacking sq under the current occupancy.
  [[nodiscard]] Bitboard attackers_to(Square sq, Color by) const;
  /// Attack set of whatever piece stands on sq (empty square -> 0).
  [[nodiscard]] Bitboard attacks_from(Square sq) const;
  /// Union of every square attacked by `by`.
  [[nodiscard]] Bitboard attacked_squares(Color by) const;

  /// Legal moves for the side to move, in a stable enumeration order.
  void generate_moves(MoveList& out, GenStage stage = GenStage::All) const;
  [[nodiscard]] bool has_legal_move() const;

  [[nodiscard]] bool is_checkmate() const;
  [[nodiscard]] bool is_stalemate() const;
  [[nodiscard]] bool is_insufficient_material() const;
  [[nodiscard]] bool is_fifty_move_draw() const { return halfmove_clock_ >= 100; }

  [[nodiscard]] bool is_capture(Move m) const;
  [[nodiscard]] bool is_castling(Move m) const;
  [[nodiscard]] bool is_en_passant(Move m) const;
  /// Piece removed by m (handles en passant), Piece::None for non-captures.
  [[nodiscard]] Piece captured_piece(Move m) const;
  [[nodiscard]] bool gives_check(Move m) const;

  void make(Move m, Undo& undo);
  void unmake(Move m, const Undo& undo);

  /// Passing moves are supported by this board; callers that simulate a
  /// pass must still check the capability before relying on it.
  static constexpr bool supports_null_move() { return true; }
  void make_null(Undo& undo);
  void unmake_null(const Undo& undo);

private:
  void clear();
  void put_piece(Piece pc, Square sq);
  void remove_piece(Piece pc, Square sq);
  void set_castling(std::uint8_t rights);
  void set_en_passant(Square sq);
  void recompute_zobrist();
  void generate_pseudo_legal(MoveList& out) const;
  void push_pawn_moves(MoveList& out) const;
  // True when the pseudo-legal move m does not leave the mover's king attacked.
  bool keeps_king_safe(Move m) const;

  std::array<Piece, 64> squares_{};
  std::array<std::array<Bitboard, 6>, 2> pieces_{{}};
  std::array<Bitboard, 2> occupied_{};
  Bitboard occupied_all_{0};
  std::array<Square, 2> kings_{Square::None, Square::None};

  Color side_{Color::White};
  std::uint8_t castling_{CastleNone};
  Square ep_square_{Square::None};
  std::uint8_t halfmove_clock_{0};
  std::uint16_t fullmove_number_{1};
  std::uint64_t zobrist_{0};
};

std::string move_to_uci(Move move);
/// Matches a coordinate move ("e2e4", "e7e8q") against the legal moves of
/// pos; returns a null Move when it is not legal there.
Move parse_uci_move(const Position& pos, std::string_view token);

}  // namespace gambit
