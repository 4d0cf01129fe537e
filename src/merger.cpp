#include "merger.hpp"
#include "logging.hpp"
#include "similarity.hpp"
#include <algorithm>

MissingChunkResult::MissingChunkResult(int chunk_index)
  : std::runtime_error("missing result for chunk " + std::to_string(chunk_index)),
    chunk_index_(chunk_index) {}

int merge_window_turns(const MergeConfig& cfg, int overlap_tokens) {
  if (cfg.window_turns > 0) return cfg.window_turns;
  const long long overlap_chars = (long long)std::max(0, overlap_tokens) * cfg.chars_per_token;
  const long long per_turn = std::max(1, cfg.average_turn_chars);
  long long n = std::max(1LL, overlap_chars / per_turn);
  return (int)std::min<long long>(n, std::max(1, cfg.max_window_turns));
}

Turn merge_turn_data(const Turn& existing, const Turn& incoming) {
  Turn out = normalize_text(incoming.text).size() > normalize_text(existing.text).size()
      ? incoming : existing;
  if (!existing.start_ts.empty() && !incoming.start_ts.empty())
    out.start_ts = std::min(existing.start_ts, incoming.start_ts);
  return out;
}

static std::vector<int> expected_indices(const ChunkManifest& manifest) {
  std::vector<int> idx;
  if (!manifest.chunks.empty()) {
    for (auto& c : manifest.chunks) idx.push_back(c.chunk_index);
  } else {
    for (int i = 0; i < manifest.chunk_count; ++i) idx.push_back(i);
  }
  std::sort(idx.begin(), idx.end());
  idx.erase(std::unique(idx.begin(), idx.end()), idx.end());
  return idx;
}

MergeResult merge_chunk_results(const std::map<int, std::vector<Turn>>& results,
                                const ChunkManifest& manifest,
                                const MergeConfig& cfg) {
  MergeResult out;
  const auto indices = expected_indices(manifest);
  for (int i : indices) {
    if (!results.count(i)) throw MissingChunkResult(i);
  }
  for (auto& kv : results) {
    if (!std::binary_search(indices.begin(), indices.end(), kv.first))
      log_warn("ignoring result for chunk " + std::to_string(kv.first) + " not in metadata");
  }

  if (indices.empty()) return out;
  if (indices.size() == 1) {
    out.turns = results.at(indices.front());
    out.stats.push_back({indices.front(), (int)out.turns.size(), 0});
    return out;
  }

  const int window = merge_window_turns(cfg, manifest.overlap_tokens);
  std::vector<Turn>& merged = out.turns;

  for (size_t n = 0; n < indices.size(); ++n) {
    const int chunk_index = indices[n];
    const auto& turns = results.at(chunk_index);
    ChunkMergeStats st{chunk_index, 0, 0};

    if (n == 0) {
      merged.insert(merged.end(), turns.begin(), turns.end());
      st.added = (int)turns.size();
    } else {
      // only the tail merged before this chunk can share overlap text with it
      const size_t prior_end = merged.size();
      size_t search_from = prior_end - std::min(prior_end, (size_t)window);
      for (auto& t : turns) {
        size_t hit = prior_end;
        for (size_t k = search_from; k < prior_end; ++k) {
          if (is_duplicate_turn(t, merged[k], cfg.similarity_threshold)) { hit = k; break; }
        }
        if (hit < prior_end) {
          merged[hit] = merge_turn_data(merged[hit], t);
          search_from = hit + 1;
          st.merged++;
        } else {
          merged.push_back(t);
          st.added++;
        }
      }
    }
    log_info("Chunk " + std::to_string(chunk_index) + ": added " + std::to_string(st.added) +
             " new turns, merged " + std::to_string(st.merged) + " duplicates");
    out.stats.push_back(st);
  }

  for (size_t i = 0; i < merged.size(); ++i) merged[i].idx = (int)i;
  log_info("Final merge: " + std::to_string(merged.size()) + " turns from " +
           std::to_string(indices.size()) + " chunks");
  return out;
}
