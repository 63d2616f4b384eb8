#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include "bench.h"
#include "book.h"
#include "debug.h"
#include "eval.h"
#include "search.h"

namespace {

void print_usage() {
  std::cout << "Usage: gambit bench [options]\n"
            << "       gambit search [--depth N] [--movetime MS] [--no-book] [--trace TOPICS] FEN\n"
            << "       gambit eval FEN\n";
}

void report_unknown_topics(std::string_view csv) {
  for (const std::string& token : gambit::enable_trace_topics(csv)) {
    std::cerr << "unknown trace topic: " << token << "\n";
  }
}

// Rejects positions the search cannot score meaningfully.
bool check_position(const gambit::Position& pos) {
  const gambit::InvariantStatus status = gambit::validate_position(pos);
  if (!status.ok) {
    std::cerr << "error: " << status.message << "\n";
  }
  return status.ok;
}

// FEN fields may arrive as one quoted argument or as separate words.
std::string append_fen_word(std::string fen, std::string_view word) {
  if (!fen.empty()) {
    fen += ' ';
  }
  fen += word;
  return fen;
}

int search_main(int argc, const char* argv[]) {
  gambit::Limits limits;
  std::string fen;
  for (int idx = 0; idx < argc; ++idx) {
    const std::string_view arg(argv[idx]);
    if (arg == "--depth" && idx + 1 < argc) {
      limits.depth = static_cast<std::int16_t>(std::stoi(argv[++idx]));
    } else if (arg == "--movetime" && idx + 1 < argc) {
      limits.movetime_ms = std::stoll(argv[++idx]);
    } else if (arg == "--no-book") {
      limits.use_book = false;
    } else if (arg == "--trace" && idx + 1 < argc) {
      report_unknown_topics(argv[++idx]);
    } else {
      fen = append_fen_word(std::move(fen), arg);
    }
  }
  if (fen.empty()) {
    fen = gambit::kStartFen;
  }
  gambit::Position pos = gambit::Position::from_fen(fen, false);
  if (!check_position(pos)) {
    return 1;
  }
  const gambit::SearchResult result =
      gambit::search(pos, limits, &gambit::LineBook::default_repertoire());
  std::cout << "info depth " << result.depth << " seldepth " << result.seldepth << " nodes "
            << result.nodes << " time " << result.elapsed_ms << " score "
            << gambit::format_score(result.eval)
            << (result.from_book ? " book" : "") << "\n";
  std::cout << "bestmove "
            << (result.best.is_null() ? std::string("0000") : gambit::move_to_uci(result.best))
            << std::endl;
  return 0;
}

int eval_main(int argc, const char* argv[]) {
  std::string fen;
  for (int idx = 0; idx < argc; ++idx) {
    fen = append_fen_word(std::move(fen), argv[idx]);
  }
  if (fen.empty()) {
    fen = gambit::kStartFen;
  }
  const gambit::Position pos = gambit::Position::from_fen(fen, false);
  if (!check_position(pos)) {
    return 1;
  }
  gambit::EvalTrace trace;
  const gambit::Score score = gambit::evaluate(pos, &trace);
  std::cout << "phase " << gambit::phase_name(trace.phase) << "\n";
  std::cout << "material " << trace.material[0] << " " << trace.material[1] << "\n";
  std::cout << "positional " << trace.positional[0] << " " << trace.positional[1] << "\n";
  std::cout << "king_safety " << trace.king_safety[0] << " " << trace.king_safety[1] << "\n";
  std::cout << "development " << trace.development[0] << " " << trace.development[1] << "\n";
  std::cout << "center " << trace.center[0] << " " << trace.center[1] << "\n";
  std::cout << "tactical " << trace.tactical[0] << " " << trace.tactical[1] << "\n";
  std::cout << "total " << score << std::endl;
  return 0;
}

}  // namespace

int main(int argc, const char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }
  const std::string_view command(argv[1]);
  try {
    if (command == "bench") {
      return gambit::bench_cli_main(argc - 2, argv + 2);
    }
    if (command == "search") {
      return search_main(argc - 2, argv + 2);
    }
    if (command == "eval") {
      return eval_main(argc - 2, argv + 2);
    }
  } catch (const std::exception& ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
  print_usage();
  return 1;
}
