#pragma once
#include "token_estimator.hpp"
#include "turn.hpp"
#include <optional>
#include <string>
#include <vector>

struct Segment {
  int id = 0;                         // 1-based
  std::optional<double> start_time;   // seconds
  std::optional<double> end_time;
  std::string topic;
  std::vector<std::string> speakers;  // distinct, first-seen order
  std::string text;                   // turn texts joined by '\n'
  int turn_count = 0;
};

// "HH:MM:SS" (each part any number, fractions allowed) to seconds; nullopt
// unless there are exactly three numeric colon-separated parts.
std::optional<double> timestamp_to_seconds(const std::string& ts);

// Groups consecutive turns into segments whose summed token estimate stays
// within max_tokens_per_segment. A turn is never split; one that exceeds the
// ceiling on its own gets a segment to itself. estimator == nullptr uses the
// 4 chars/token heuristic.
std::vector<Segment> create_segments(const std::vector<Turn>& turns,
                                     int max_tokens_per_segment = 3000,
                                     const TokenEstimator* estimator = nullptr);
