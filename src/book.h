#pragma once
// book.h -- Opening book interface consulted at the search root, plus a
// small in-memory book built from coordinate-notation lines.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "board.h"

namespace gambit {

class OpeningBook {
public:
  virtual ~OpeningBook() = default;

  /// Book move for pos, or a null Move when the position is not covered.
  virtual Move probe(const Position& pos) const = 0;
};

class LineBook final : public OpeningBook {
public:
  static constexpr int kMaxBookPly = 15;

  /// Replays a space-separated list of UCI moves from the start position.
  /// Throws std::runtime_error when a move is not legal where it is played.
  void add_line(std::string_view name, std::string_view uci_moves);

  Move probe(const Position& pos) const override;

  /// Name of the first line reaching pos, when any does.
  std::optional<std::string_view> opening_name(const Position& pos) const;

  [[nodiscard]] std::size_t size() const { return continuations_.size(); }
  [[nodiscard]] bool empty() const { return continuations_.empty(); }

  static const LineBook& default_repertoire();

private:
  std::unordered_map<std::uint64_t, Move> continuations_;
  std::unordered_map<std::uint64_t, std::size_t> reached_by_;
  std::vector<std::string> names_;
};

}  // namespace gambit
