#pragma once
#include "token_estimator.hpp"
#include <cstddef>
#include <string>
#include <vector>

struct ChunkParams {
  int chunk_size_tokens = 15000;
  int overlap_tokens = 2000;
  int chars_per_token = 3;   // conservative; converts token budgets to byte budgets
  size_t search_radius = 500;

  size_t chunk_size_chars() const { return (size_t)chunk_size_tokens * (size_t)chars_per_token; }
  size_t overlap_chars() const { return (size_t)overlap_tokens * (size_t)chars_per_token; }
};

struct Chunk {
  int index = 0;
  std::string text;
  size_t start_offset = 0;          // inclusive
  size_t end_offset = 0;            // exclusive
  size_t overlap_start_offset = 0;  // == end_offset when there is no next chunk
  std::string overlap_text;
  int estimated_tokens = 0;
  bool has_next = false;
};

// Per-chunk entry of the run's metadata record.
struct ChunkRecord {
  int chunk_index = 0;
  std::string input_path;    // chunk text file
  std::string overlap_path;  // empty when the chunk has no overlap
  std::string output_path;   // where the analysis step writes this chunk's turns
  size_t start_char = 0;
  size_t end_char = 0;
  size_t overlap_start_char = 0;
  int estimated_tokens = 0;
  bool has_next_chunk = false;
};

struct ChunkManifest {
  std::string meeting_id;
  std::string original_input_path;
  bool chunked = true;
  int chunk_count = 0;
  size_t total_chars = 0;
  int estimated_total_tokens = 0;
  int chunk_size_tokens = 0;
  int overlap_tokens = 0;
  std::vector<ChunkRecord> chunks;
  std::string created_at;   // ISO 8601, UTC
};

// Position of a paragraph or line break near target, searched in this order:
// "\n\n" backward, "\n\n" forward, "\n" backward, "\n" forward, all within
// radius. Returns the offset just past the break, or target if none is found.
size_t find_natural_break(const std::string& text, size_t target, size_t radius = 500);

// Overlapping chunks covering all of text. estimator == nullptr estimates
// with params.chars_per_token.
std::vector<Chunk> create_overlapping_chunks(const std::string& text,
                                             const ChunkParams& params = ChunkParams{},
                                             const TokenEstimator* estimator = nullptr);

// Reads a whole file; throws std::runtime_error when it cannot be opened.
std::string read_text_file(const std::string& path);

// Builds the metadata record; file paths are laid out under out_dir as
// chunks/chunk_<i>.txt, chunks/chunk_<i>_overlap.txt and chunk_<i>_turns.json.
ChunkManifest make_manifest(const std::vector<Chunk>& chunks,
                            const ChunkParams& params,
                            const std::string& meeting_id,
                            const std::string& input_path,
                            const std::string& out_dir,
                            size_t total_chars,
                            int estimated_total_tokens);

// Writes chunk and overlap files named by the manifest.
void write_chunk_files(const std::vector<Chunk>& chunks, const ChunkManifest& manifest);

// Current UTC time as YYYY-MM-DDTHH:MM:SSZ.
std::string utc_timestamp();
