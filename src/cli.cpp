#include "cli.hpp"
#include <cstdlib>
#include <iostream>

static const char* USAGE =
"transcript_chunker count <transcript> [--tokenizer-model path]\n"
"transcript_chunker chunk <transcript> [--out-dir dir] [--meeting-id id] [--chunk-size N] [--chunk-overlap N]\n"
"                         [--threshold N] [--force] [--sqlite path] [--tokenizer-model path]\n"
"transcript_chunker merge <metadata.json> [--results-dir dir] [--out path] [--window N] [--similarity X]\n"
"transcript_chunker segment <turns.json> [--out path] [--max-tokens N] [--tokenizer-model path]\n"
"common flags: --verbose --quiet\n";

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 3) { std::cerr << USAGE; std::exit(1); }
  a.mode = argv[1];
  if (a.mode != "count" && a.mode != "chunk" && a.mode != "merge" && a.mode != "segment") {
    std::cerr << USAGE; std::exit(1);
  }
  a.input_path = argv[2];

  int i = 3;
  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      dst = argv[i++];
    };
    if (f == "--out-dir") next(a.out_dir);
    else if (f == "--out") next(a.out_path);
    else if (f == "--results-dir") next(a.results_dir);
    else if (f == "--meeting-id") next(a.meeting_id);
    else if (f == "--sqlite") next(a.sqlite_path);
    else if (f == "--tokenizer-model") next(a.tokenizer_model);
    else if (f == "--chunk-size") { std::string v; next(v); a.chunk_size = std::stoi(v); }
    else if (f == "--chunk-overlap") { std::string v; next(v); a.chunk_overlap = std::stoi(v); }
    else if (f == "--threshold") { std::string v; next(v); a.threshold = std::stoi(v); }
    else if (f == "--window") { std::string v; next(v); a.window = std::stoi(v); }
    else if (f == "--similarity") { std::string v; next(v); a.similarity = std::stod(v); }
    else if (f == "--max-tokens") { std::string v; next(v); a.max_tokens = std::stoi(v); }
    else if (f == "--force") a.force = true;
    else if (f == "--verbose") a.verbose = true;
    else if (f == "--quiet") a.quiet = true;
    else { std::cerr << "Unknown flag: " << f << "\n" << USAGE; std::exit(1); }
  }
  return a;
}
