#include "token_estimator.hpp"
#include <algorithm>
#include <stdexcept>

HeuristicTokenEstimator::HeuristicTokenEstimator(int chars_per_token)
  : chars_per_token_(chars_per_token) {
  if (chars_per_token_ <= 0) throw std::invalid_argument("chars_per_token must be > 0");
}

int HeuristicTokenEstimator::estimate(const std::string& text) const {
  if (text.empty()) return 0;
  return std::max(1, (int)(text.size() / (size_t)chars_per_token_));
}

std::string HeuristicTokenEstimator::name() const {
  return "heuristic(" + std::to_string(chars_per_token_) + " chars/token)";
}

bool needs_chunking(const std::string& text, int threshold_tokens) {
  return (long long)(text.size() / 3) > (long long)threshold_tokens;
}
