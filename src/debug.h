#pragma once
// debug.h -- Trace toggles, trace sink and validation helpers for diagnostics.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "board.h"

namespace gambit {

enum class TraceTopic : std::uint8_t {
  Search = 0,
  QSearch,
  Eval,
  Motifs,
  Moves,
  Book,
  Count
};

using TraceWriter = void (*)(TraceTopic, std::string_view);

void set_trace_topic(TraceTopic topic, bool enabled);
bool trace_enabled(TraceTopic topic);
std::optional<TraceTopic> trace_topic_from_string(std::string_view token);
std::string_view trace_topic_name(TraceTopic topic);

/// Enables every topic named in a comma-separated list ("search,book", or
/// "all"). Returns the tokens that name no topic.
std::vector<std::string> enable_trace_topics(std::string_view csv);

// Replaces the default stdout sink; nullptr restores it.
void set_trace_writer(TraceWriter writer);
// Emits "trace <topic> <message>" when the topic is enabled.
void trace_emit(TraceTopic topic, std::string_view message);

// Result of validate_position: message is "position ok" or the first broken
// invariant reported by Position::is_sane.
struct InvariantStatus {
  bool ok{true};
  std::string message{"ok"};
};

InvariantStatus validate_position(const Position& pos);

}  // namespace gambit
