#pragma once
#include "chunker.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Audit trail of chunking runs: one row per run, one row per chunk.
class Store {
public:
  explicit Store(const std::string& sqlite_path);
  ~Store();
  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  void ensure_schema();

  // Inserts the run and all its chunks in one transaction; returns the run id.
  int64_t record_run(const ChunkManifest& m);
  void upsert_chunk(int64_t run_id, const ChunkRecord& c);

  ChunkRecord get_chunk(int64_t run_id, int chunk_index) const;
  std::vector<ChunkRecord> get_chunks(int64_t run_id) const;
  int run_count() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
