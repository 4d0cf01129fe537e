#pragma once
#include "chunker.hpp"
#include "turn.hpp"
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// Tunables for reconciling turns across chunk seams.
struct MergeConfig {
  double similarity_threshold = 0.75;
  int chars_per_token = 3;        // must match the chunker's ratio
  int average_turn_chars = 200;   // used to turn the overlap size into a turn count
  int max_window_turns = 50;
  int window_turns = 0;           // > 0 overrides the overlap-derived window
};

// How many already-merged turns a new chunk's turns are compared against.
int merge_window_turns(const MergeConfig& cfg, int overlap_tokens);

struct ChunkMergeStats {
  int chunk_index = 0;
  int added = 0;
  int merged = 0;
};

struct MergeResult {
  std::vector<Turn> turns;
  std::vector<ChunkMergeStats> stats;
};

// A chunk listed in the manifest has no result.
class MissingChunkResult : public std::runtime_error {
public:
  explicit MissingChunkResult(int chunk_index);
  int chunk_index() const { return chunk_index_; }
private:
  int chunk_index_;
};

// Combines two records judged to be the same utterance: the longer
// normalized text wins (ties keep `existing`), and the earlier start_ts is
// kept when both have one.
Turn merge_turn_data(const Turn& existing, const Turn& incoming);

// Merges per-chunk turn lists, keyed by chunk index, into one ordered list.
// Throws MissingChunkResult if the manifest names a chunk with no entry in
// `results`. A single chunk is passed through untouched; otherwise the
// output is re-indexed 0..N-1.
MergeResult merge_chunk_results(const std::map<int, std::vector<Turn>>& results,
                                const ChunkManifest& manifest,
                                const MergeConfig& cfg = MergeConfig{});
