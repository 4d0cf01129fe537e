#include "cli.hpp"
#include "chunker.hpp"
#include "llama_token_estimator.hpp"
#include "logging.hpp"
#include "merger.hpp"
#include "pipeline.hpp"
#include "segmenter.hpp"
#include "store.hpp"
#include "turn_io.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

static const int kContextWindowTokens = 200000;

static int run_count(const Args& args) {
  auto est = load_token_estimator(args.tokenizer_model);
  const std::string text = read_text_file(args.input_path);

  size_t lines = 1, words = 0;
  for (char c : text) if (c == '\n') lines++;
  { std::istringstream ss(text); std::string w; while (ss >> w) words++; }
  const int tokens = est->estimate(text);
  const double per_token = tokens > 0 ? (double)text.size() / tokens : 0.0;

  std::cout << std::fixed << std::setprecision(2);
  std::cout << "Transcript:      " << fs::path(args.input_path).filename().string() << "\n"
            << "Characters:      " << text.size() << "\n"
            << "Lines:           " << lines << "\n"
            << "Words:           " << words << "\n"
            << "Tokens:          " << tokens << " (" << est->name() << ")\n"
            << "Chars/Token:     " << per_token << "\n"
            << std::setprecision(1)
            << "Context used:    " << 100.0 * tokens / kContextWindowTokens << "% of "
            << kContextWindowTokens << " tokens\n";

  if (tokens > kContextWindowTokens)
    std::cout << "Exceeds the context window: ~" << tokens / 150000 + 1 << " chunks recommended\n";
  else if (tokens > 150000)
    std::cout << "Large transcript: chunking advised for a safety margin\n";
  else
    std::cout << "Fits within the context window\n";
  std::cout << "Needs chunking:  " << (needs_chunking(text, args.threshold) ? "yes" : "no")
            << " (threshold " << args.threshold << " tokens)\n";

  // ~1 turn per 50 input tokens, ~25 output tokens of JSON per turn
  const int turns = tokens / 50;
  std::cout << "Estimated turns: ~" << turns << "\n"
            << "Output tokens:   ~" << turns * 25 << "\n";
  return 0;
}

static int run_chunk(const Args& args) {
  auto est = load_token_estimator(args.tokenizer_model);
  const std::string text = read_text_file(args.input_path);

  ChunkRunOptions opts;
  opts.meeting_id = args.meeting_id;
  opts.input_path = args.input_path;
  opts.out_dir = args.out_dir;
  opts.params.chunk_size_tokens = args.chunk_size;
  opts.params.overlap_tokens = args.chunk_overlap;
  opts.threshold_tokens = args.threshold;
  opts.force = args.force;
  ChunkManifest manifest = run_chunking(text, opts, *est);

  if (!args.sqlite_path.empty()) {
    Store store(args.sqlite_path);
    int64_t run_id = store.record_run(manifest);
    log_info("Recorded run " + std::to_string(run_id) + " in " + args.sqlite_path);
  }

  std::cout << metadata_path(args.out_dir) << "\n";
  return 0;
}

static int run_merge(const Args& args) {
  ChunkManifest manifest = manifest_from_json(read_json_file(args.input_path));

  TurnsDocument first;
  auto results = load_chunk_results(manifest, args.results_dir, &first);

  MergeConfig cfg;
  cfg.similarity_threshold = args.similarity;
  cfg.window_turns = args.window;
  json doc = build_merged_document(manifest, results, first, cfg);

  const std::string out_path = args.out_path.empty()
      ? default_merged_path(args.input_path, args.results_dir) : args.out_path;
  write_json_file(out_path, doc);
  std::cout << out_path << "\n";
  return 0;
}

static int run_segment(const Args& args) {
  auto est = load_token_estimator(args.tokenizer_model);
  TurnsDocument doc = parse_turns_document(read_text_file(args.input_path));
  auto segments = create_segments(doc.turns, args.max_tokens, est.get());
  log_info("Created " + std::to_string(segments.size()) + " segments from " +
           std::to_string(doc.turns.size()) + " turns");

  json j = segments_to_json(segments);
  if (args.out_path.empty()) {
    std::cout << j.dump(2) << "\n";
  } else {
    write_json_file(args.out_path, j);
    std::cout << args.out_path << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);
  if (args.verbose) set_log_level(LogLevel::Debug);
  else if (args.quiet) set_log_level(LogLevel::Warn);

  try {
    if (args.mode == "count") return run_count(args);
    if (args.mode == "chunk") return run_chunk(args);
    if (args.mode == "merge") return run_merge(args);
    if (args.mode == "segment") return run_segment(args);
  } catch (const MissingChunkResult& e) {
    log_error(std::string("merge aborted: ") + e.what());
    return 1;
  } catch (const std::exception& e) {
    log_error(e.what());
    return 1;
  }
  return 1;
}
