// src/llama_token_estimator.cpp
#include "llama_token_estimator.hpp"
#include "logging.hpp"
#include <llama.h>
#include <filesystem>
#include <stdexcept>
#include <vector>

struct LlamaTokenEstimator::Impl {
  llama_model* model = nullptr;
  const llama_vocab* vocab = nullptr;
  std::string path;

  explicit Impl(const std::string& model_path) : path(model_path) {
    llama_backend_init();

    llama_model_params mp = llama_model_default_params();
    mp.n_gpu_layers = 0;
    mp.vocab_only = true;   // tokenizer only, no weights
    model = llama_load_model_from_file(model_path.c_str(), mp);
    if (!model) {
      llama_backend_free();
      throw std::runtime_error("tokenizer: failed to load model " + model_path);
    }
    vocab = llama_model_get_vocab(model);
  }

  ~Impl() {
    if (model) llama_free_model(model);
    llama_backend_free();
  }

  int count(const std::string& text) const {
    if (text.empty()) return 0;
    // a null buffer makes llama_tokenize report the required size as a negative number
    int32_t n = llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                               nullptr, 0, /*add_special=*/false, /*parse_special=*/false);
    if (n >= 0) return n;
    std::vector<llama_token> toks(-n);
    int32_t m = llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                               toks.data(), (int32_t)toks.size(), false, false);
    if (m < 0) throw std::runtime_error("tokenizer: tokenize failed");
    return m;
  }
};

LlamaTokenEstimator::LlamaTokenEstimator(const std::string& model_path)
  : impl_(new Impl(model_path)) {}

LlamaTokenEstimator::~LlamaTokenEstimator() = default;

int LlamaTokenEstimator::estimate(const std::string& text) const {
  return impl_->count(text);
}

std::string LlamaTokenEstimator::name() const {
  return "llama(" + std::filesystem::path(impl_->path).filename().string() + ")";
}

std::unique_ptr<TokenEstimator> load_token_estimator(const std::string& model_path) {
  if (!model_path.empty()) {
    if (!std::filesystem::exists(model_path)) {
      log_warn("tokenizer model not found: " + model_path + "; using heuristic");
    } else {
      try {
        return std::unique_ptr<TokenEstimator>(new LlamaTokenEstimator(model_path));
      } catch (const std::runtime_error& e) {
        log_warn(std::string(e.what()) + "; using heuristic");
      }
    }
  }
  return std::unique_ptr<TokenEstimator>(new HeuristicTokenEstimator(4));
}
