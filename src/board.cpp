#include "board.h"
#include "attacks.h"
#include "debug.h"

#include <array>
#include <bit>
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <string>

namespace gambit {
namespace {

constexpr Bitboard kLightSquares = 0x55AA55AA55AA55AAULL;

constexpr std::array<std::uint8_t, 64> kCastlingClear = [] {
  std::array<std::uint8_t, 64> mask{};
  mask[static_cast<int>(Square::A1)] = CastleWQ;
  mask[static_cast<int>(Square::H1)] = CastleWK;
  mask[static_cast<int>(Square::E1)] = CastleWK | CastleWQ;
  mask[static_cast<int>(Square::A8)] = CastleBQ;
  mask[static_cast<int>(Square::H8)] = CastleBK;
  mask[static_cast<int>(Square::E8)] = CastleBK | CastleBQ;
  return mask;
}();

constexpr std::array<PieceType, 4> kPromotionOrder = {
    PieceType::Queen, PieceType::Rook, PieceType::Bishop, PieceType::Knight};

struct ZobristTables {
  std::array<std::array<std::array<std::uint64_t, 64>, 6>, 2> piece{};
  std::array<std::uint64_t, 16> castling{};
  std::array<std::uint64_t, 8> ep{};
  std::uint64_t side{0};
};

constexpr std::uint64_t splitmix64(std::uint64_t& state) {
  std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

const ZobristTables& zobrist_tables() {
  static const ZobristTables tables = [] {
    ZobristTables t{};
    std::uint64_t seed = 0x6A4B17C0FFEE5EEDULL;
    for (auto& by_type : t.piece) {
      for (auto& by_square : by_type) {
        for (auto& key : by_square) {
          key = splitmix64(seed);
        }
      }
    }
    for (auto& key : t.castling) {
      key = splitmix64(seed);
    }
    for (auto& key : t.ep) {
      key = splitmix64(seed);
    }
    t.side = splitmix64(seed);
    return t;
  }();
  return tables;
}

constexpr int pawn_push(Color c) {
  return c == Color::White ? 8 : -8;
}

Square offset(Square sq, int delta) {
  return static_cast<Square>(static_cast<int>(sq) + delta);
}

}  // namespace

Position::Position() {
  clear();
}

void Position::clear() {
  squares_.fill(Piece::None);
  for (auto& bb : pieces_) {
    bb.fill(0ULL);
  }
  occupied_.fill(0ULL);
  occupied_all_ = 0ULL;
  kings_.fill(Square::None);
  side_ = Color::White;
  castling_ = CastleNone;
  ep_square_ = Square::None;
  halfmove_clock_ = 0;
  fullmove_number_ = 1;
  zobrist_ = 0ULL;
}

Bitboard Position::pieces(Color color, PieceType type) const {
  if (type == PieceType::None) {
    return 0ULL;
  }
  return pieces_[color_index(color)][static_cast<int>(type)];
}

int Position::game_ply() const {
  const int base = (static_cast<int>(fullmove_number_) - 1) * 2;
  return (base < 0 ? 0 : base) + (side_ == Color::Black ? 1 : 0);
}

bool Position::has_both_kings() const {
  return kings_[0] != Square::None && kings_[1] != Square::None;
}

bool Position::is_sane(std::string* reason) const {
  const auto fail = [&](std::string_view msg) {
    if (reason) {
      reason->assign(msg);
    }
    return false;
  };

  std::array<Bitboard, 2> derived{0ULL, 0ULL};
  std::array<int, 2> king_count{0, 0};
  for (int idx = 0; idx < 64; ++idx) {
    const Piece pc = squares_[idx];
    if (pc == Piece::None) {
      continue;
    }
    derived[color_index(color_of(pc))] |= bit(static_cast<Square>(idx));
    if (type_of(pc) == PieceType::King) {
      ++king_count[color_index(color_of(pc))];
    }
  }

  if (king_count[0] != 1) {
    return fail(king_count[0] == 0 ? "white king missing" : "multiple white kings");
  }
  if (king_count[1] != 1) {
    return fail(king_count[1] == 0 ? "black king missing" : "multiple black kings");
  }
  if (derived[0] != occupied_[0] || derived[1] != occupied_[1]) {
    return fail("occupancy mismatch");
  }
  if ((derived[0] | derived[1]) != occupied_all_) {
    return fail("aggregate occupancy mismatch");
  }
  for (const Color c : {Color::White, Color::Black}) {
    const Square ksq = kings_[color_index(c)];
    if (ksq == Square::None || squares_[static_cast<int>(ksq)] != make_piece(c, PieceType::King)) {
      return fail("king square mismatch");
    }
  }
  if (in_check(flip(side_))) {
    return fail("side not to move is in check");
  }
  if (compute_zobrist() != zobrist_) {
    return fail("zobrist mismatch");
  }
  if (ep_square_ != Square::None) {
    const Rank ep_rank = rank_of(ep_square_);
    if (ep_rank != Rank::R3 && ep_rank != Rank::R6) {
      return fail("invalid en passant rank");
    }
    const Color mover = ep_rank == Rank::R3 ? Color::White : Color::Black;
    const Square pawn_sq = offset(ep_square_, pawn_push(mover));
    if (squares_[static_cast<int>(pawn_sq)] != make_piece(mover, PieceType::Pawn)) {
      return fail("en passant pawn missing");
    }
  }
  return true;
}

Position Position::from_fen(std::string_view fen, bool strict) {
  Position pos;

  std::array<std::string_view, 6> fields{};
  std::size_t field_idx = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= fen.size(); ++i) {
    if (i == fen.size() || fen[i] == ' ') {
      if (i > start && field_idx < fields.size()) {
        fields[field_idx++] = fen.substr(start, i - start);
      }
      start = i + 1;
    }
  }
  if (field_idx < 4) {
    throw std::runtime_error("FEN requires at least 4 fields");
  }

  int file = 0;
  int rank = 7;
  for (const char c : fields[0]) {
    if (c == '/') {
      if (file != 8 && strict) {
        throw std::runtime_error("FEN rank does not cover 8 files");
      }
      --rank;
      file = 0;
      continue;
    }
    if (c >= '1' && c <= '8') {
      file += c - '0';
      continue;
    }
    const Piece pc = piece_from_char(c);
    if (pc == Piece::None) {
      throw std::runtime_error("Invalid piece in FEN");
    }
    if (!on_board(file, rank)) {
      throw std::runtime_error("FEN piece placement overflows the board");
    }
    pos.put_piece(pc, make_square(file, rank));
    ++file;
  }
  if (rank != 0 || file > 8) {
    throw std::runtime_error("FEN piece placement must describe 8 ranks");
  }

  if (fields[1] == "w") {
    pos.side_ = Color::White;
  } else if (fields[1] == "b") {
    pos.side_ = Color::Black;
  } else {
    throw std::runtime_error("Invalid side to move in FEN");
  }

  if (fields[2] != "-") {
    for (const char c : fields[2]) {
      switch (c) {
        case 'K':
          pos.castling_ |= CastleWK;
          break;
        case 'Q':
          pos.castling_ |= CastleWQ;
          break;
        case 'k':
          pos.castling_ |= CastleBK;
          break;
        case 'q':
          pos.castling_ |= CastleBQ;
          break;
        default:
          if (strict) {
            throw std::runtime_error("Invalid castling rights");
          }
      }
    }
  }

  if (fields[3] != "-") {
    const Square ep_sq = square_from_string(fields[3]);
    if (ep_sq != Square::None) {
      pos.ep_square_ = ep_sq;
    } else if (strict) {
      throw std::runtime_error("Invalid en passant square");
    }
  }

  if (field_idx >= 5) {
    unsigned value = 0;
    std::from_chars(fields[4].data(), fields[4].data() + fields[4].size(), value);
    pos.halfmove_clock_ = static_cast<std::uint8_t>(value > 255 ? 255 : value);
  }
  if (field_idx >= 6) {
    unsigned value = 1;
    std::from_chars(fields[5].data(), fields[5].data() + fields[5].size(), value);
    pos.fullmove_number_ = static_cast<std::uint16_t>(value == 0 ? 1 : value);
  }

  pos.recompute_zobrist();
  return pos;
}

std::string Position::to_fen() const {
  std::ostringstream oss;
  for (int rank = 7; rank >= 0; --rank) {
    int empty = 0;
    for (int file = 0; file < 8; ++file) {
      const Piece pc = squares_[rank * 8 + file];
      if (pc == Piece::None) {
        ++empty;
        continue;
      }
      if (empty > 0) {
        oss << empty;
        empty = 0;
      }
      oss << piece_to_char(pc);
    }
    if (empty > 0) {
      oss << empty;
    }
    if (rank > 0) {
      oss << '/';
    }
  }
  oss << ' ' << (side_ == Color::White ? 'w' : 'b') << ' ';
  if (castling_ == CastleNone) {
    oss << '-';
  } else {
    if (castling_ & CastleWK) oss << 'K';
    if (castling_ & CastleWQ) oss << 'Q';
    if (castling_ & CastleBK) oss << 'k';
    if (castling_ & CastleBQ) oss << 'q';
  }
  oss << ' ' << (ep_square_ == Square::None ? "-" : square_to_string(ep_square_));
  oss << ' ' << static_cast<int>(halfmove_clock_);
  oss << ' ' << static_cast<int>(fullmove_number_);
  return oss.str();
}

Bitboard Position::attackers_to(Square sq, Color by) const {
  if (sq == Square::None) {
    return 0ULL;
  }
  const auto& own = pieces_[color_index(by)];
  const Bitboard diagonal = own[static_cast<int>(PieceType::Bishop)] |
                            own[static_cast<int>(PieceType::Queen)];
  const Bitboard straight = own[static_cast<int>(PieceType::Rook)] |
                            own[static_cast<int>(PieceType::Queen)];
  return (pawn_attacks(flip(by), sq) & own[static_cast<int>(PieceType::Pawn)]) |
         (knight_attacks(sq) & own[static_cast<int>(PieceType::Knight)]) |
         (bishop_attacks(sq, occupied_all_) & diagonal) |
         (rook_attacks(sq, occupied_all_) & straight) |
         (king_attacks(sq) & own[static_cast<int>(PieceType::King)]);
}

bool Position::is_square_attacked(Square sq, Color by) const {
  return attackers_to(sq, by) != 0ULL;
}

Bitboard Position::attacks_from(Square sq) const {
  const Piece pc = piece_on(sq);
  if (pc == Piece::None) {
    return 0ULL;
  }
  return piece_attacks(type_of(pc), color_of(pc), sq, occupied_all_);
}

Bitboard Position::attacked_squares(Color by) const {
  Bitboard attacks = 0ULL;
  Bitboard own = occupied_[color_index(by)];
  while (own) {
    attacks |= attacks_from(pop_lsb(own));
  }
  return attacks;
}

bool Position::in_check(Color color) const {
  const Square king_sq = kings_[color_index(color)];
  if (king_sq == Square::None) {
    return false;
  }
  return is_square_attacked(king_sq, flip(color));
}

void Position::push_pawn_moves(MoveList& out) const {
  const Color us = side_;
  const int forward = pawn_push(us);
  const Rank start_rank = us == Color::White ? Rank::R2 : Rank::R7;
  const Rank promo_rank = us == Color::White ? Rank::R8 : Rank::R1;
  const Bitboard theirs = occupied_[color_index(flip(us))];

  Bitboard pawns = pieces_[color_index(us)][static_cast<int>(PieceType::Pawn)];
  while (pawns) {
    const Square from = pop_lsb(pawns);
    const int to_idx = static_cast<int>(from) + forward;
    if (to_idx < 0 || to_idx >= 64) {
      continue;
    }
    const Square to = static_cast<Square>(to_idx);
    if (!(occupied_all_ & bit(to))) {
      if (rank_of(to) == promo_rank) {
        for (const PieceType promo : kPromotionOrder) {
          out.push_back(make_move(from, to, MoveFlag::Promotion, promo));
        }
      } else {
        out.push_back(make_move(from, to, MoveFlag::Quiet));
        if (rank_of(from) == start_rank) {
          const Square two = offset(to, forward);
          if (!(occupied_all_ & bit(two))) {
            out.push_back(make_move(from, two, MoveFlag::DoublePush));
          }
        }
      }
    }

    const Bitboard reach = pawn_attacks(us, from);
    Bitboard captures = reach & theirs;
    while (captures) {
      const Square target = pop_lsb(captures);
      if (rank_of(target) == promo_rank) {
        for (const PieceType promo : kPromotionOrder) {
          out.push_back(make_move(from, target, MoveFlag::PromotionCapture, promo));
        }
      } else {
        out.push_back(make_move(from, target, MoveFlag::Capture));
      }
    }

    if (ep_square_ != Square::None && (reach & bit(ep_square_)) &&
        !(occupied_all_ & bit(ep_square_))) {
      const Square victim = offset(ep_square_, -forward);
      if (piece_on(victim) == make_piece(flip(us), PieceType::Pawn)) {
        out.push_back(make_move(from, ep_square_, MoveFlag::EnPassant));
      }
    }
  }
}

void Position::generate_pseudo_legal(MoveList& out) const {
  out.clear();
  push_pawn_moves(out);

  const int us = color_index(side_);
  const Bitboard ours = occupied_[us];
  const Bitboard theirs = occupied_[color_index(flip(side_))];

  for (const PieceType type : {PieceType::Knight, PieceType::Bishop, PieceType::Rook,
                               PieceType::Queen, PieceType::King}) {
    Bitboard movers = pieces_[us][static_cast<int>(type)];
    while (movers) {
      const Square from = pop_lsb(movers);
      Bitboard targets = piece_attacks(type, side_, from, occupied_all_) & ~ours;
      while (targets) {
        const Square to = pop_lsb(targets);
        const bool capture = (theirs & bit(to)) != 0ULL;
        out.push_back(make_move(from, to, capture ? MoveFlag::Capture : MoveFlag::Quiet));
      }
    }
  }

  const Color enemy = flip(side_);
  const bool white = side_ == Color::White;
  const Square king_home = white ? Square::E1 : Square::E8;
  if (kings_[us] != king_home || is_square_attacked(king_home, enemy)) {
    return;
  }
  const Piece rook = make_piece(side_, PieceType::Rook);
  const std::uint8_t king_side = white ? CastleWK : CastleBK;
  const std::uint8_t queen_side = white ? CastleWQ : CastleBQ;
  const Square f = white ? Square::F1 : Square::F8;
  const Square g = white ? Square::G1 : Square::G8;
  const Square h = white ? Square::H1 : Square::H8;
  const Square d = white ? Square::D1 : Square::D8;
  const Square c = white ? Square::C1 : Square::C8;
  const Square b = white ? Square::B1 : Square::B8;
  const Square a = white ? Square::A1 : Square::A8;
  if ((castling_ & king_side) && piece_on(h) == rook &&
      !(occupied_all_ & (bit(f) | bit(g))) &&
      !is_square_attacked(f, enemy) && !is_square_attacked(g, enemy)) {
    out.push_back(make_move(king_home, g, MoveFlag::KingCastle));
  }
  if ((castling_ & queen_side) && piece_on(a) == rook &&
      !(occupied_all_ & (bit(d) | bit(c) | bit(b))) &&
      !is_square_attacked(d, enemy) && !is_square_attacked(c, enemy)) {
    out.push_back(make_move(king_home, c, MoveFlag::QueenCastle));
  }
}

void Position::generate_moves(MoveList& out, GenStage stage) const {
  MoveList pseudo;
  generate_pseudo_legal(pseudo);
  out.clear();

  const Color us = side_;
  Position scratch = *this;
  for (const Move move : pseudo) {
    const bool capture = is_capture_flag(move_flag(move));
    if ((stage == GenStage::Captures && !capture) || (stage == GenStage::Quiets && capture)) {
      continue;
    }
    Undo undo;
    scratch.make(move, undo);
    const bool legal = !scratch.in_check(us);
    scratch.unmake(move, undo);
    if (legal) {
      out.push_back(move);
    }
  }

  if (trace_enabled(TraceTopic::Moves)) {
    std::ostringstream oss;
    oss << "stage=" << (stage == GenStage::Captures ? "captures"
                        : stage == GenStage::Quiets ? "quiets"
                                                    : "all")
        << " stm=" << (us == Color::White ? "white" : "black")
        << " pseudo=" << pseudo.size() << " legal=" << out.size();
    const std::size_t samples = out.size() < 8 ? out.size() : 8;
    if (samples > 0) {
      oss << " moves=";
      for (std::size_t idx = 0; idx < samples; ++idx) {
        oss << (idx > 0 ? "," : "") << move_to_uci(out[idx]);
      }
    }
    trace_emit(TraceTopic::Moves, oss.str());
  }
}

bool Position::has_legal_move() const {
  MoveList pseudo;
  generate_pseudo_legal(pseudo);
  for (const Move move : pseudo) {
    if (keeps_king_safe(move)) {
      return true;
    }
  }
  return false;
}

bool Position::keeps_king_safe(Move m) const {
  Position scratch = *this;
  Undo undo;
  scratch.make(m, undo);
  return !scratch.in_check(side_);
}

bool Position::is_checkmate() const {
  return in_check(side_) && !has_legal_move();
}

bool Position::is_stalemate() const {
  return !in_check(side_) && !has_legal_move();
}

bool Position::is_insufficient_material() const {
  for (const auto& own : pieces_) {
    if (own[static_cast<int>(PieceType::Pawn)] || own[static_cast<int>(PieceType::Rook)] ||
        own[static_cast<int>(PieceType::Queen)]) {
      return false;
    }
  }
  const Bitboard knights = pieces_[0][static_cast<int>(PieceType::Knight)] |
                           pieces_[1][static_cast<int>(PieceType::Knight)];
  const Bitboard bishops = pieces_[0][static_cast<int>(PieceType::Bishop)] |
                           pieces_[1][static_cast<int>(PieceType::Bishop)];
  if (std::popcount(knights | bishops) <= 1) {
    return true;
  }
  // Bishops only, all on one square colour.
  return knights == 0ULL &&
         ((bishops & kLightSquares) == 0ULL || (bishops & ~kLightSquares) == 0ULL);
}

bool Position::is_capture(Move m) const {
  return is_capture_flag(move_flag(m));
}

bool Position::is_castling(Move m) const {
  const MoveFlag flag = move_flag(m);
  return flag == MoveFlag::KingCastle || flag == MoveFlag::QueenCastle;
}

bool Position::is_en_passant(Move m) const {
  return move_flag(m) == MoveFlag::EnPassant;
}

Piece Position::captured_piece(Move m) const {
  const MoveFlag flag = move_flag(m);
  if (flag == MoveFlag::EnPassant) {
    return piece_on(offset(to_square(m), -pawn_push(side_)));
  }
  if (is_capture_flag(flag)) {
    return piece_on(to_square(m));
  }
  return Piece::None;
}

bool Position::gives_check(Move m) const {
  Position scratch = *this;
  Undo undo;
  scratch.make(m, undo);
  return scratch.in_check(scratch.side_);
}

void Position::make(Move m, Undo& undo) {
  const Square from = from_square(m);
  const Square to = to_square(m);
  Piece moving = squares_[static_cast<int>(from)];
  GAMBIT_ASSERT(moving != Piece::None);
  const MoveFlag flag = move_flag(m);
  const PieceType origin_type = type_of(moving);

  undo.key = zobrist_;
  undo.move = m;
  undo.castling = castling_;
  undo.en_passant = ep_square_;
  undo.halfmove_clock = halfmove_clock_;
  undo.captured = Piece::None;

  set_en_passant(Square::None);

  const Square capture_sq =
      flag == MoveFlag::EnPassant ? offset(to, -pawn_push(side_)) : to;
  if (squares_[static_cast<int>(capture_sq)] != Piece::None) {
    undo.captured = squares_[static_cast<int>(capture_sq)];
    remove_piece(undo.captured, capture_sq);
  }

  remove_piece(moving, from);
  if (is_promotion_flag(flag)) {
    moving = make_piece(side_, promotion_type(m));
  }
  put_piece(moving, to);

  if (flag == MoveFlag::KingCastle || flag == MoveFlag::QueenCastle) {
    const int rank = static_cast<int>(rank_of(to));
    const bool king_side = flag == MoveFlag::KingCastle;
    const Square rook_from = make_square(king_side ? 7 : 0, rank);
    const Square rook_to = make_square(king_side ? 5 : 3, rank);
    const Piece rook = squares_[static_cast<int>(rook_from)];
    remove_piece(rook, rook_from);
    put_piece(rook, rook_to);
  } else if (flag == MoveFlag::DoublePush) {
    set_en_passant(offset(from, pawn_push(side_)));
  }

  set_castling(static_cast<std::uint8_t>(castling_ & ~kCastlingClear[static_cast<int>(from)] &
                                         ~kCastlingClear[static_cast<int>(to)]));

  halfmove_clock_ = (origin_type == PieceType::Pawn || undo.captured != Piece::None)
                        ? 0
                        : static_cast<std::uint8_t>(halfmove_clock_ + 1);
  if (side_ == Color::Black) {
    ++fullmove_number_;
  }
  side_ = flip(side_);
  zobrist_ ^= zobrist_tables().side;
}

void Position::unmake(Move m, const Undo& undo) {
  const Square from = from_square(m);
  const Square to = to_square(m);
  const MoveFlag flag = move_flag(m);
  side_ = flip(side_);

  Piece moving = squares_[static_cast<int>(to)];
  if (flag == MoveFlag::KingCastle || flag == MoveFlag::QueenCastle) {
    const int rank = static_cast<int>(rank_of(to));
    const bool king_side = flag == MoveFlag::KingCastle;
    const Square rook_from = make_square(king_side ? 5 : 3, rank);
    const Square rook_to = make_square(king_side ? 7 : 0, rank);
    const Piece rook = squares_[static_cast<int>(rook_from)];
    remove_piece(rook, rook_from);
    put_piece(rook, rook_to);
  }

  remove_piece(moving, to);
  if (is_promotion_flag(flag)) {
    moving = make_piece(side_, PieceType::Pawn);
  }
  put_piece(moving, from);

  if (undo.captured != Piece::None) {
    const Square capture_sq =
        flag == MoveFlag::EnPassant ? offset(to, -pawn_push(side_)) : to;
    put_piece(undo.captured, capture_sq);
  }

  castling_ = undo.castling;
  ep_square_ = undo.en_passant;
  halfmove_clock_ = undo.halfmove_clock;
  if (side_ == Color::Black) {
    --fullmove_number_;
  }
  zobrist_ = undo.key;
}

void Position::make_null(Undo& undo) {
  undo.key = zobrist_;
  undo.move = Move{};
  undo.castling = castling_;
  undo.en_passant = ep_square_;
  undo.halfmove_clock = halfmove_clock_;
  undo.captured = Piece::None;

  set_en_passant(Square::None);
  halfmove_clock_ = static_cast<std::uint8_t>(halfmove_clock_ + 1);
  if (side_ == Color::Black) {
    ++fullmove_number_;
  }
  side_ = flip(side_);
  zobrist_ ^= zobrist_tables().side;
}

void Position::unmake_null(const Undo& undo) {
  side_ = flip(side_);
  if (side_ == Color::Black) {
    --fullmove_number_;
  }
  ep_square_ = undo.en_passant;
  halfmove_clock_ = undo.halfmove_clock;
  zobrist_ = undo.key;
}

void Position::put_piece(Piece pc, Square sq) {
  const int idx = static_cast<int>(sq);
  if (squares_[idx] != Piece::None) {
    remove_piece(squares_[idx], sq);
  }
  squares_[idx] = pc;
  if (pc == Piece::None) {
    return;
  }
  const int c = color_index(color_of(pc));
  const int type = static_cast<int>(type_of(pc));
  const Bitboard mask = bit(sq);
  pieces_[c][type] |= mask;
  occupied_[c] |= mask;
  occupied_all_ |= mask;
  if (type_of(pc) == PieceType::King) {
    kings_[c] = sq;
  }
  zobrist_ ^= zobrist_tables().piece[c][type][idx];
}

void Position::remove_piece(Piece pc, Square sq) {
  if (pc == Piece::None) {
    return;
  }
  const int idx = static_cast<int>(sq);
  const int c = color_index(color_of(pc));
  const int type = static_cast<int>(type_of(pc));
  const Bitboard mask = bit(sq);
  squares_[idx] = Piece::None;
  pieces_[c][type] &= ~mask;
  occupied_[c] &= ~mask;
  occupied_all_ &= ~mask;
  if (type_of(pc) == PieceType::King && kings_[c] == sq) {
    kings_[c] = Square::None;
  }
  zobrist_ ^= zobrist_tables().piece[c][type][idx];
}

void Position::set_castling(std::uint8_t rights) {
  if (rights == castling_) {
    return;
  }
  const auto& tables = zobrist_tables();
  zobrist_ ^= tables.castling[castling_];
  castling_ = rights;
  zobrist_ ^= tables.castling[castling_];
}

void Position::set_en_passant(Square sq) {
  const auto& tables = zobrist_tables();
  if (ep_square_ != Square::None) {
    zobrist_ ^= tables.ep[static_cast<int>(file_of(ep_square_))];
  }
  ep_square_ = sq;
  if (ep_square_ != Square::None) {
    zobrist_ ^= tables.ep[static_cast<int>(file_of(ep_square_))];
  }
}

void Position::recompute_zobrist() {
  zobrist_ = compute_zobrist();
}

std::uint64_t Position::compute_zobrist() const {
  const auto& tables = zobrist_tables();
  std::uint64_t value = 0ULL;
  for (int sq = 0; sq < 64; ++sq) {
    const Piece pc = squares_[sq];
    if (pc != Piece::None) {
      value ^= tables.piece[color_index(color_of(pc))][static_cast<int>(type_of(pc))][sq];
    }
  }
  value ^= tables.castling[castling_];
  if (ep_square_ != Square::None) {
    value ^= tables.ep[static_cast<int>(file_of(ep_square_))];
  }
  if (side_ == Color::Black) {
    value ^= tables.side;
  }
  return value;
}

std::string move_to_uci(Move move) {
  if (move.is_null()) {
    return "0000";
  }
  std::string result = square_to_string(from_square(move)) + square_to_string(to_square(move));
  switch (promotion_type(move)) {
    case PieceType::Queen:
      result.push_back('q');
      break;
    case PieceType::Rook:
      result.push_back('r');
      break;
    case PieceType::Bishop:
      result.push_back('b');
      break;
    case PieceType::Knight:
      result.push_back('n');
      break;
    default:
      break;
  }
  return result;
}

Move parse_uci_move(const Position& pos, std::string_view token) {
  if (token.size() < 4 || token.size() > 5) {
    return Move{};
  }
  MoveList moves;
  pos.generate_moves(moves, GenStage::All);
  for (const Move move : moves) {
    if (move_to_uci(move) == token) {
      return move;
    }
  }
  return Move{};
}

}  // namespace gambit
