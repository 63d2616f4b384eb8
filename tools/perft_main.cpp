#include "perft.h"

#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

namespace {

struct Options {
  std::string fen{gambit::kStartFen};
  std::string suite_path;
  int depth{4};
  bool split{false};
  bool stats{false};
};

Options parse(int argc, char** argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "-f" || arg == "--fen") && i + 1 < argc) {
      opt.fen = argv[++i];
    } else if ((arg == "-d" || arg == "--depth") && i + 1 < argc) {
      opt.depth = std::stoi(argv[++i]);
    } else if ((arg == "-s" || arg == "--suite") && i + 1 < argc) {
      opt.suite_path = argv[++i];
    } else if (arg == "--split") {
      opt.split = true;
    } else if (arg == "--stats") {
      opt.stats = true;
    }
  }
  return opt;
}

// Suite lines are "fen|depth|expected"; '#' starts a comment.
int run_suite(const std::string& path) {
  std::ifstream suite(path);
  if (!suite) {
    std::cerr << "Failed to open perft suite: " << path << "\n";
    return 1;
  }
  bool ok = true;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(suite, line)) {
    ++line_no;
    if (line.empty() || line[0] == '#') {
      continue;
    }
    const auto first_bar = line.find('|');
    const auto second_bar =
        first_bar == std::string::npos ? std::string::npos : line.find('|', first_bar + 1);
    if (second_bar == std::string::npos) {
      std::cerr << "Malformed suite line " << line_no << ": " << line << "\n";
      ok = false;
      continue;
    }
    gambit::Position pos = gambit::Position::from_fen(line.substr(0, first_bar), false);
    const int depth = std::stoi(line.substr(first_bar + 1, second_bar - first_bar - 1));
    const std::uint64_t expected = std::stoull(line.substr(second_bar + 1));
    const auto start = std::chrono::steady_clock::now();
    const std::uint64_t nodes = gambit::perft(pos, depth);
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start)
                                .count();
    std::cout << "line=" << line_no << " depth=" << depth << " nodes=" << nodes
              << " expected=" << expected << " time_ms=" << elapsed_ms;
    if (nodes != expected) {
      std::cout << " mismatch";
      ok = false;
    }
    std::cout << "\n";
  }
  return ok ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const Options options = parse(argc, argv);
    if (!options.suite_path.empty()) {
      return run_suite(options.suite_path);
    }

    gambit::Position pos = gambit::Position::from_fen(options.fen, false);
    if (options.split) {
      std::uint64_t total = 0;
      for (const auto& [move, nodes] : gambit::perft_divide(pos, options.depth)) {
        total += nodes;
        std::cout << gambit::move_to_uci(move) << ": " << nodes << "\n";
      }
      std::cout << "total: " << total << "\n";
      return 0;
    }
    if (options.stats) {
      const gambit::PerftStats stats = gambit::perft_stats(pos, options.depth);
      std::cout << "nodes=" << stats.nodes << " captures=" << stats.captures
                << " ep=" << stats.en_passant << " castles=" << stats.castles
                << " promotions=" << stats.promotions << " checks=" << stats.checks
                << " checkmates=" << stats.checkmates << "\n";
      return 0;
    }

    const auto start = std::chrono::steady_clock::now();
    const std::uint64_t nodes = gambit::perft(pos, options.depth);
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start)
                                .count();
    std::cout << "perft depth=" << options.depth << " nodes=" << nodes
              << " time_ms=" << elapsed_ms;
    if (elapsed_ms > 0) {
      std::cout << " nps=" << (nodes * 1000ULL) / static_cast<std::uint64_t>(elapsed_ms);
    }
    std::cout << "\n";
  } catch (const std::exception& ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
