#include "segmenter.hpp"
#include <re2/re2.h>
#include <unordered_set>

std::optional<double> timestamp_to_seconds(const std::string& ts) {
  // surrounding whitespace on each part is ignored; out-of-range numbers are rejected
  static const RE2 hms("\\s*([^:\\s]+)\\s*:\\s*([^:\\s]+)\\s*:\\s*([^:\\s]+)\\s*");
  double h = 0, m = 0, s = 0;
  if (ts.empty() || !RE2::FullMatch(ts, hms, &h, &m, &s)) return std::nullopt;
  return h * 3600 + m * 60 + s;
}

static Segment build_segment(int id, const std::vector<const Turn*>& turns) {
  Segment seg;
  seg.id = id;
  seg.topic = "Segment " + std::to_string(id);
  seg.start_time = timestamp_to_seconds(turns.front()->start_ts);
  seg.end_time = timestamp_to_seconds(turns.back()->end_ts);
  seg.turn_count = (int)turns.size();

  std::unordered_set<std::string> seen;
  for (size_t i = 0; i < turns.size(); ++i) {
    const std::string speaker = turns[i]->speaker.empty() ? "Unknown" : turns[i]->speaker;
    if (seen.insert(speaker).second) seg.speakers.push_back(speaker);
    if (i) seg.text += '\n';
    seg.text += turns[i]->text;
  }
  return seg;
}

std::vector<Segment> create_segments(const std::vector<Turn>& turns,
                                     int max_tokens_per_segment,
                                     const TokenEstimator* estimator) {
  HeuristicTokenEstimator fallback(4);
  const TokenEstimator& est = estimator ? *estimator : fallback;

  std::vector<Segment> segments;
  std::vector<const Turn*> current;
  long long current_tokens = 0;

  for (auto& t : turns) {
    const int tokens = est.estimate(t.text);
    if (!current.empty() && current_tokens + tokens > max_tokens_per_segment) {
      segments.push_back(build_segment((int)segments.size() + 1, current));
      current.clear();
      current_tokens = 0;
    }
    current.push_back(&t);
    current_tokens += tokens;
  }
  if (!current.empty()) segments.push_back(build_segment((int)segments.size() + 1, current));
  return segments;
}
