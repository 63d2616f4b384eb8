#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include "bench.h"
#include "debug.h"
#include "search.h"
#include "searchparams.h"

namespace gambit {

namespace {

struct BenchOptions {
  Limits limits;
  std::size_t positions{kBenchFens.size()};
};

struct BenchTotals {
  std::uint64_t nodes{0};
  std::uint64_t elapsed_ms{0};
  int mates{0};
  int aborted{0};
};

std::optional<long long> to_integer(std::string_view token) {
  if (token.empty()) {
    return std::nullopt;
  }
  const std::string copy(token);
  char* end = nullptr;
  const long long value = std::strtoll(copy.c_str(), &end, 10);
  if (end == copy.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return value;
}

void print_usage() {
  std::printf("Usage: gambit bench [--depth N] [--positions N] [--nodes LIMIT]\n");
  std::printf("                    [--movetime MS] [--fixed-depth] [--no-tactics]\n");
  std::printf("                    [--trace TOPICS]\n");
  std::fflush(stdout);
}

// Applies a valued option; returns false for names that take no value.
bool apply_valued(std::string_view name, long long value, BenchOptions& opt) {
  if (name == "--depth") {
    opt.limits.depth = static_cast<std::int16_t>(std::clamp<long long>(value, 1, 64));
  } else if (name == "--positions") {
    opt.positions = static_cast<std::size_t>(
        std::clamp<long long>(value, 1, static_cast<long long>(kBenchFens.size())));
  } else if (name == "--nodes") {
    opt.limits.nodes = value > 0 ? value : -1;
  } else if (name == "--movetime") {
    opt.limits.movetime_ms = std::max<long long>(1, value);
  } else {
    return false;
  }
  return true;
}

BenchOptions parse_options(int argc, const char* argv[]) {
  BenchOptions opt;
  opt.limits.use_book = false;
  for (int idx = 0; idx < argc; ++idx) {
    const std::string_view arg(argv[idx]);
    if (arg == "--help" || arg == "-h") {
      print_usage();
      std::exit(0);
    }
    if (arg == "--fixed-depth") {
      opt.limits.adaptive_depth = false;
      continue;
    }
    if (arg == "--no-tactics") {
      opt.limits.eval.tactical_weighting = false;
      continue;
    }
    if (arg == "--trace" && idx + 1 < argc) {
      for (const std::string& token : enable_trace_topics(argv[++idx])) {
        std::fprintf(stderr, "unknown trace topic: %s\n", token.c_str());
      }
      continue;
    }
    if (idx + 1 < argc) {
      if (const auto value = to_integer(argv[idx + 1]); value && apply_valued(arg, *value, opt)) {
        ++idx;
        continue;
      }
    }
    // A bare number is shorthand for --depth.
    if (const auto depth = to_integer(arg)) {
      apply_valued("--depth", *depth, opt);
      continue;
    }
    std::fprintf(stderr, "ignoring bench argument: %s\n", argv[idx]);
  }
  return opt;
}

}  // namespace

int bench_cli_main(int argc, const char* argv[]) {
  const BenchOptions opt = parse_options(argc, argv);
  BenchTotals totals;

  for (std::size_t idx = 0; idx < opt.positions; ++idx) {
    Position pos = Position::from_fen(kBenchFens[idx], false);
    const auto start = std::chrono::steady_clock::now();
    const SearchResult result = search(pos, opt.limits);
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start)
                                .count();

    totals.nodes += static_cast<std::uint64_t>(result.nodes);
    totals.elapsed_ms += static_cast<std::uint64_t>(elapsed_ms);
    totals.mates += is_mate_score(result.eval) ? 1 : 0;
    totals.aborted += result.aborted ? 1 : 0;

    std::printf("position %zu best %s score %s depth %d nodes %lld time %lld%s\n", idx + 1,
                result.best.is_null() ? "0000" : move_to_uci(result.best).c_str(),
                format_score(result.eval).c_str(), result.depth,
                static_cast<long long>(result.nodes), static_cast<long long>(elapsed_ms),
                result.aborted ? " aborted" : "");
  }

  const std::uint64_t nps = (totals.nodes * 1000ULL) / std::max<std::uint64_t>(1, totals.elapsed_ms);
  std::printf("%llu nodes %llu nps mates %d aborted %d\n",
              static_cast<unsigned long long>(totals.nodes),
              static_cast<unsigned long long>(nps), totals.mates, totals.aborted);
  std::fflush(stdout);
  return 0;
}

}  // namespace gambit
