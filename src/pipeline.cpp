#include "pipeline.hpp"
#include "logging.hpp"
#include <filesystem>

namespace fs = std::filesystem;

bool should_chunk(const std::string& text, const TokenEstimator& est,
                  int threshold_tokens, bool force) {
  if (force) return true;
  if (dynamic_cast<const HeuristicTokenEstimator*>(&est))
    return needs_chunking(text, threshold_tokens);
  return est.estimate(text) > threshold_tokens;
}

std::string metadata_path(const std::string& out_dir) {
  return (fs::path(out_dir) / "chunks" / "metadata.json").string();
}

ChunkManifest run_chunking(const std::string& text, const ChunkRunOptions& opts,
                           const TokenEstimator& est) {
  const int total_tokens = est.estimate(text);
  const bool chunk = should_chunk(text, est, opts.threshold_tokens, opts.force);
  log_info("Estimated tokens: " + std::to_string(total_tokens) +
           " (" + est.name() + "), needs chunking: " + (chunk ? "yes" : "no"));

  ChunkManifest manifest;
  if (chunk) {
    auto chunks = create_overlapping_chunks(text, opts.params, &est);
    manifest = make_manifest(chunks, opts.params, opts.meeting_id, opts.input_path, opts.out_dir,
                             text.size(), total_tokens);
    write_chunk_files(chunks, manifest);
  } else {
    // whole transcript is chunk 0; the analysis step reads the input file itself
    manifest = make_manifest({}, opts.params, opts.meeting_id, opts.input_path, opts.out_dir,
                             text.size(), total_tokens);
    manifest.chunked = false;
    manifest.chunk_count = 1;
    ChunkRecord r;
    r.input_path = opts.input_path;
    r.output_path = (fs::path(opts.out_dir) / "chunk_0_turns.json").string();
    r.end_char = text.size();
    r.overlap_start_char = text.size();
    r.estimated_tokens = total_tokens;
    manifest.chunks.push_back(r);
  }

  write_json_file(metadata_path(opts.out_dir), manifest_to_json(manifest));
  return manifest;
}

std::string chunk_result_path(const ChunkRecord& rec, const std::string& results_dir) {
  if (results_dir.empty()) return rec.output_path;
  return (fs::path(results_dir) / ("chunk_" + std::to_string(rec.chunk_index) + "_turns.json")).string();
}

std::map<int, std::vector<Turn>> load_chunk_results(const ChunkManifest& manifest,
                                                    const std::string& results_dir,
                                                    TurnsDocument* first) {
  std::map<int, std::vector<Turn>> results;
  for (auto& rec : manifest.chunks) {
    const std::string path = chunk_result_path(rec, results_dir);
    if (!fs::exists(path)) {
      log_error("no result for chunk " + std::to_string(rec.chunk_index) + " at " + path);
      continue;
    }
    log_info("Reading chunk " + std::to_string(rec.chunk_index) + " results from " + path);
    TurnsDocument doc = parse_turns_document(read_text_file(path));
    if (first && results.empty()) *first = doc;
    results[rec.chunk_index] = std::move(doc.turns);
  }
  return results;
}

json build_merged_document(const ChunkManifest& manifest,
                           const std::map<int, std::vector<Turn>>& results,
                           const TurnsDocument& first,
                           const MergeConfig& cfg) {
  MergeResult merged = merge_chunk_results(results, manifest, cfg);

  TurnsDocument out;
  out.meeting_id = manifest.meeting_id.empty() ? first.meeting_id : manifest.meeting_id;
  out.time_zone = first.time_zone;
  out.turns = std::move(merged.turns);

  json doc = turns_document_to_json(out);
  auto errors = validate_turns(doc);
  if (errors.empty()) {
    log_info("Merged turns passed schema validation");
  } else {
    // reported, not fatal
    for (auto& e : errors) log_error("Merged turns failed validation: " + e);
  }
  doc["metadata"] = {
    {"meeting_id", out.meeting_id},
    {"total_turns", out.turns.size()},
    {"chunk_count", (int)merged.stats.size()},
    {"merged_at", utc_timestamp()},
  };
  log_info("Merged " + std::to_string(out.turns.size()) + " turns from " +
           std::to_string(merged.stats.size()) + " chunks");
  return doc;
}

std::string default_merged_path(const std::string& metadata_file, const std::string& results_dir) {
  const fs::path base = results_dir.empty()
      ? fs::path(metadata_file).parent_path().parent_path()
      : fs::path(results_dir);
  return (base / "01_turns.json").string();
}
