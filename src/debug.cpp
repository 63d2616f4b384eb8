#include "debug.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace gambit {
namespace {

constexpr std::size_t kTopicCount = static_cast<std::size_t>(TraceTopic::Count);

constexpr std::array<std::string_view, kTopicCount> kTopicNames = {
    "search", "qsearch", "eval", "motifs", "moves", "book"};

std::array<bool, kTopicCount>& trace_flags() {
  static std::array<bool, kTopicCount> flags{};
  return flags;
}

std::mutex& trace_mutex() {
  static std::mutex mutex;
  return mutex;
}

TraceWriter& trace_writer() {
  static TraceWriter writer = nullptr;
  return writer;
}

std::string lowercase(std::string_view sv) {
  std::string out(sv.begin(), sv.end());
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

}  // namespace

void set_trace_topic(TraceTopic topic, bool enabled) {
  if (topic == TraceTopic::Count) {
    return;
  }
  trace_flags()[static_cast<std::size_t>(topic)] = enabled;
}

bool trace_enabled(TraceTopic topic) {
  if (topic == TraceTopic::Count) {
    return false;
  }
  return trace_flags()[static_cast<std::size_t>(topic)];
}

void set_trace_writer(TraceWriter writer) {
  std::lock_guard<std::mutex> lock(trace_mutex());
  trace_writer() = writer;
}

std::optional<TraceTopic> trace_topic_from_string(std::string_view token) {
  const std::string norm = lowercase(token);
  for (std::size_t idx = 0; idx < kTopicNames.size(); ++idx) {
    if (norm == kTopicNames[idx]) {
      return static_cast<TraceTopic>(idx);
    }
  }
  return std::nullopt;
}

std::string_view trace_topic_name(TraceTopic topic) {
  const auto idx = static_cast<std::size_t>(topic);
  return idx < kTopicNames.size() ? kTopicNames[idx] : std::string_view{"unknown"};
}

std::vector<std::string> enable_trace_topics(std::string_view csv) {
  std::vector<std::string> unknown;
  std::size_t cursor = 0;
  while (cursor <= csv.size()) {
    const std::size_t comma = std::min(csv.find(',', cursor), csv.size());
    const std::string_view token = csv.substr(cursor, comma - cursor);
    cursor = comma + 1;
    if (token.empty()) {
      continue;
    }
    if (lowercase(token) == "all") {
      for (std::size_t idx = 0; idx < kTopicCount; ++idx) {
        set_trace_topic(static_cast<TraceTopic>(idx), true);
      }
    } else if (const auto topic = trace_topic_from_string(token)) {
      set_trace_topic(*topic, true);
    } else {
      unknown.emplace_back(token);
    }
  }
  return unknown;
}

void trace_emit(TraceTopic topic, std::string_view message) {
  if (!trace_enabled(topic)) {
    return;
  }
  std::ostringstream oss;
  oss << "trace " << trace_topic_name(topic) << ' ' << message;
  const std::string payload = oss.str();
  std::lock_guard<std::mutex> lock(trace_mutex());
  if (const TraceWriter writer = trace_writer()) {
    writer(topic, payload);
  } else {
    std::cout << "info string " << payload << '\n';
    std::cout.flush();
  }
}

InvariantStatus validate_position(const Position& pos) {
  InvariantStatus status;
  if (!pos.is_sane(&status.message)) {
    status.ok = false;
    if (status.message.empty()) {
      status.message = "unknown invariant violation";
    }
  } else {
    status.message = "position ok";
  }
  return status;
}

}  // namespace gambit
