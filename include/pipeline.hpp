#pragma once
#include "chunker.hpp"
#include "merger.hpp"
#include "token_estimator.hpp"
#include "turn_io.hpp"
#include <map>
#include <string>
#include <vector>

struct ChunkRunOptions {
  std::string meeting_id = "meeting";
  std::string input_path;
  std::string out_dir = "./out";
  ChunkParams params;
  int threshold_tokens = 50000;
  bool force = false;
};

// Whether a transcript should be split at all. The heuristic estimator
// defers to the conservative len/3 pre-check; a precise tokenizer count is
// compared with the threshold directly. force always chunks.
bool should_chunk(const std::string& text, const TokenEstimator& est,
                  int threshold_tokens, bool force = false);

// <out_dir>/chunks/metadata.json
std::string metadata_path(const std::string& out_dir);

// Chunks text (or describes it as a single unchunked chunk 0 that points at
// the original file), writes chunk files and metadata.json, and returns the
// manifest that was written.
ChunkManifest run_chunking(const std::string& text, const ChunkRunOptions& opts,
                           const TokenEstimator& est);

// Path of chunk i's analysis result: results_dir/chunk_<i>_turns.json when
// results_dir is set, the manifest's output path otherwise.
std::string chunk_result_path(const ChunkRecord& rec, const std::string& results_dir);

// Reads every chunk result that exists. Absent files are logged and left out
// so the merge reports them. *first receives the first document read.
std::map<int, std::vector<Turn>> load_chunk_results(const ChunkManifest& manifest,
                                                    const std::string& results_dir,
                                                    TurnsDocument* first = nullptr);

// Merges the results into the final turns document, with schema problems
// logged and a metadata block appended.
json build_merged_document(const ChunkManifest& manifest,
                           const std::map<int, std::vector<Turn>>& results,
                           const TurnsDocument& first,
                           const MergeConfig& cfg = MergeConfig{});

// 01_turns.json in results_dir, or next to the chunks/ directory holding the metadata.
std::string default_merged_path(const std::string& metadata_file, const std::string& results_dir);
