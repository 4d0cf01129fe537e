#pragma once
#include "token_estimator.hpp"
#include <memory>
#include <string>

// Exact token counts from a GGUF model's vocabulary (loaded vocab-only).
class LlamaTokenEstimator : public TokenEstimator {
public:
  explicit LlamaTokenEstimator(const std::string& model_path);
  ~LlamaTokenEstimator() override;

  int estimate(const std::string& text) const override;
  std::string name() const override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Picks the llama.cpp estimator when model_path names a loadable model,
// the 4 chars/token heuristic otherwise. Called once at startup.
std::unique_ptr<TokenEstimator> load_token_estimator(const std::string& model_path);
