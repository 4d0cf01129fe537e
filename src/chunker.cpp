#include "chunker.hpp"
#include "logging.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using std::string;
namespace fs = std::filesystem;

size_t find_natural_break(const string& text, size_t target, size_t radius) {
  const size_t n = text.size();
  if (target >= n) return target;
  const size_t lo = target > radius ? target - radius : 0;
  const size_t hi = std::min(n, target + radius);

  // paragraph break, backward then forward
  for (size_t i = target; i > lo; --i) {
    if (i + 1 < n && text[i] == '\n' && text[i+1] == '\n') return i + 2;
  }
  for (size_t i = target; i + 1 < hi; ++i) {
    if (text[i] == '\n' && text[i+1] == '\n') return i + 2;
  }
  // line break, backward then forward
  for (size_t i = target; i > lo; --i) {
    if (text[i] == '\n') return i + 1;
  }
  for (size_t i = target; i < hi; ++i) {
    if (text[i] == '\n') return i + 1;
  }
  return target;
}

static void check_params(const ChunkParams& p) {
  if (p.chunk_size_tokens <= 0 || p.chars_per_token <= 0)
    throw std::invalid_argument("chunk size and chars per token must be > 0");
  if (p.overlap_tokens < 0 || p.overlap_tokens >= p.chunk_size_tokens)
    throw std::invalid_argument("overlap must be >= 0 and smaller than the chunk size");
}

std::vector<Chunk> create_overlapping_chunks(const string& text,
                                             const ChunkParams& params,
                                             const TokenEstimator* estimator) {
  check_params(params);
  HeuristicTokenEstimator fallback(params.chars_per_token);
  const TokenEstimator& est = estimator ? *estimator : fallback;

  const size_t total = text.size();
  const size_t size_chars = params.chunk_size_chars();
  const size_t overlap_chars = params.overlap_chars();
  const size_t stride = size_chars - overlap_chars;

  log_info("Chunking " + std::to_string(total) + " chars, chunk size " +
           std::to_string(size_chars) + " chars, overlap " + std::to_string(overlap_chars) + " chars");

  std::vector<Chunk> chunks;
  size_t pos = 0;
  while (pos < total) {
    const size_t start = pos;
    const size_t target = std::min(start + size_chars, total);
    size_t end = target < total ? find_natural_break(text, target, params.search_radius) : total;
    if (end <= start) end = target;

    Chunk c;
    c.index = (int)chunks.size();
    c.text = text.substr(start, end - start);
    c.start_offset = start;
    c.end_offset = end;
    c.has_next = end < total;
    if (c.has_next) {
      c.overlap_start_offset = std::max(start, end > overlap_chars ? end - overlap_chars : 0);
      c.overlap_text = text.substr(c.overlap_start_offset, end - c.overlap_start_offset);
    } else {
      c.overlap_start_offset = end;
    }
    c.estimated_tokens = est.estimate(c.text);

    log_debug("Chunk " + std::to_string(c.index) + ": chars " + std::to_string(start) + "-" +
              std::to_string(end) + " (" + std::to_string(c.text.size()) + " chars)");
    chunks.push_back(std::move(c));

    if (end >= total) break;

    const size_t next_target = start + stride;
    size_t next = next_target < total
        ? find_natural_break(text, next_target, params.search_radius) : end;
    // the next chunk starts inside this one: no gap, and always forward
    if (next > end) next = end;
    if (next <= start) next = std::min(next_target, end);
    pos = next;
  }

  log_info("Created " + std::to_string(chunks.size()) + " chunks from " +
           std::to_string(total) + " character transcript");
  return chunks;
}

string read_text_file(const string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

ChunkManifest make_manifest(const std::vector<Chunk>& chunks,
                            const ChunkParams& params,
                            const string& meeting_id,
                            const string& input_path,
                            const string& out_dir,
                            size_t total_chars,
                            int estimated_total_tokens) {
  ChunkManifest m;
  m.meeting_id = meeting_id;
  m.original_input_path = input_path;
  m.chunk_count = (int)chunks.size();
  m.total_chars = total_chars;
  m.estimated_total_tokens = estimated_total_tokens;
  m.chunk_size_tokens = params.chunk_size_tokens;
  m.overlap_tokens = params.overlap_tokens;
  m.created_at = utc_timestamp();

  const fs::path base(out_dir);
  for (auto& c : chunks) {
    const string i = std::to_string(c.index);
    ChunkRecord r;
    r.chunk_index = c.index;
    r.input_path = (base / "chunks" / ("chunk_" + i + ".txt")).string();
    if (!c.overlap_text.empty())
      r.overlap_path = (base / "chunks" / ("chunk_" + i + "_overlap.txt")).string();
    r.output_path = (base / ("chunk_" + i + "_turns.json")).string();
    r.start_char = c.start_offset;
    r.end_char = c.end_offset;
    r.overlap_start_char = c.overlap_start_offset;
    r.estimated_tokens = c.estimated_tokens;
    r.has_next_chunk = c.has_next;
    m.chunks.push_back(std::move(r));
  }
  return m;
}

static void write_file(const string& path, const string& data) {
  fs::path p(path);
  if (p.has_parent_path()) fs::create_directories(p.parent_path());
  std::ofstream out(path, std::ios::binary);
  if (!out) throw std::runtime_error("cannot write " + path);
  out << data;
}

void write_chunk_files(const std::vector<Chunk>& chunks, const ChunkManifest& manifest) {
  if (chunks.size() != manifest.chunks.size())
    throw std::runtime_error("manifest does not describe these chunks");
  for (size_t i = 0; i < chunks.size(); ++i) {
    const auto& rec = manifest.chunks[i];
    write_file(rec.input_path, chunks[i].text);
    if (!rec.overlap_path.empty()) write_file(rec.overlap_path, chunks[i].overlap_text);
    log_info("Wrote chunk " + std::to_string(rec.chunk_index) + " (" +
             std::to_string(chunks[i].text.size()) + " chars)");
  }
}

string utc_timestamp() {
  std::time_t now = std::time(nullptr);
  std::tm tm_utc{};
  gmtime_r(&now, &tm_utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
  return buf;
}
