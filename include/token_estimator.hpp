#pragma once
#include <cstddef>
#include <string>

// Counts (or approximates) model tokens for a piece of text.
class TokenEstimator {
public:
  virtual ~TokenEstimator() = default;
  virtual int estimate(const std::string& text) const = 0;
  virtual std::string name() const = 0;
};

// Character-ratio fallback: 0 for empty text, otherwise max(1, len / ratio).
class HeuristicTokenEstimator : public TokenEstimator {
public:
  explicit HeuristicTokenEstimator(int chars_per_token = 4);

  int estimate(const std::string& text) const override;
  std::string name() const override;

  int chars_per_token() const { return chars_per_token_; }

private:
  int chars_per_token_;
};

// Rough "does this transcript need chunking at all" check (len / 3 against a threshold).
bool needs_chunking(const std::string& text, int threshold_tokens = 50000);
