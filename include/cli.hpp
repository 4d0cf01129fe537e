#pragma once
#include <string>

struct Args {
  std::string mode;             // "count", "chunk", "merge" or "segment"
  std::string input_path;       // transcript, metadata.json or turns document
  std::string out_dir = "./out";
  std::string out_path;         // merge/segment output; empty = default location
  std::string results_dir;      // merge: where chunk_<i>_turns.json live
  std::string meeting_id = "meeting";
  std::string sqlite_path;      // empty = no audit trail
  std::string tokenizer_model;  // GGUF file; empty = heuristic estimate
  int chunk_size = 15000;       // tokens
  int chunk_overlap = 2000;     // tokens
  int threshold = 50000;        // chunk only above this many tokens
  bool force = false;           // chunk even below the threshold
  int window = 0;               // merge window in turns; 0 = derive from overlap
  double similarity = 0.75;
  int max_tokens = 3000;        // per segment
  bool verbose = false;
  bool quiet = false;
};

Args parse_cli(int argc, char** argv);
