#include "store.hpp"
#include "logging.hpp"
#include <sqlite3.h>
#include <stdexcept>

struct Store::Impl {
  sqlite3* db = nullptr;

  ~Impl() {
    if (db) sqlite3_close(db);
  }

  void exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
      std::string e = err ? err : "unknown";
      sqlite3_free(err);
      throw std::runtime_error("sqlite: " + e);
    }
  }

  sqlite3_stmt* prepare(const char* sql) const {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
      throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
    return st;
  }
};

static ChunkRecord read_chunk_row(sqlite3_stmt* st) {
  ChunkRecord c;
  c.chunk_index = sqlite3_column_int(st, 0);
  c.start_char = (size_t)sqlite3_column_int64(st, 1);
  c.end_char = (size_t)sqlite3_column_int64(st, 2);
  c.overlap_start_char = (size_t)sqlite3_column_int64(st, 3);
  c.estimated_tokens = sqlite3_column_int(st, 4);
  c.has_next_chunk = sqlite3_column_int(st, 5) != 0;
  return c;
}

Store::Store(const std::string& path) : impl_(new Impl) {
  if (sqlite3_open(path.c_str(), &impl_->db) != SQLITE_OK) {
    std::string e = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
    throw std::runtime_error("sqlite open failed: " + e);
  }
  ensure_schema();
}

Store::~Store() = default;

void Store::ensure_schema() {
  impl_->exec(
    "CREATE TABLE IF NOT EXISTS runs ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " meeting_id TEXT NOT NULL,"
    " input_path TEXT NOT NULL,"
    " chunk_count INTEGER NOT NULL,"
    " total_chars INTEGER NOT NULL,"
    " estimated_tokens INTEGER NOT NULL,"
    " chunk_size_tokens INTEGER NOT NULL,"
    " overlap_tokens INTEGER NOT NULL,"
    " created_at TEXT NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS chunks ("
    " run_id INTEGER NOT NULL REFERENCES runs(id),"
    " chunk_index INTEGER NOT NULL,"
    " start_char INTEGER NOT NULL,"
    " end_char INTEGER NOT NULL,"
    " overlap_start_char INTEGER NOT NULL,"
    " estimated_tokens INTEGER NOT NULL,"
    " has_next INTEGER NOT NULL,"
    " PRIMARY KEY (run_id, chunk_index)"
    ");");
}

int64_t Store::record_run(const ChunkManifest& m) {
  impl_->exec("BEGIN;");
  try {
    sqlite3_stmt* st = impl_->prepare(
      "INSERT INTO runs (meeting_id, input_path, chunk_count, total_chars, estimated_tokens,"
      " chunk_size_tokens, overlap_tokens, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    sqlite3_bind_text(st, 1, m.meeting_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 2, m.original_input_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(st, 3, m.chunk_count);
    sqlite3_bind_int64(st, 4, (sqlite3_int64)m.total_chars);
    sqlite3_bind_int(st, 5, m.estimated_total_tokens);
    sqlite3_bind_int(st, 6, m.chunk_size_tokens);
    sqlite3_bind_int(st, 7, m.overlap_tokens);
    sqlite3_bind_text(st, 8, m.created_at.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(st) != SQLITE_DONE) {
      sqlite3_finalize(st);
      throw std::runtime_error("sqlite insert run failed");
    }
    sqlite3_finalize(st);

    const int64_t run_id = sqlite3_last_insert_rowid(impl_->db);
    for (auto& c : m.chunks) upsert_chunk(run_id, c);
    impl_->exec("COMMIT;");
    return run_id;
  } catch (const std::runtime_error&) {
    if (sqlite3_exec(impl_->db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK)
      log_warn(std::string("sqlite rollback failed: ") + sqlite3_errmsg(impl_->db));
    throw;
  }
}

void Store::upsert_chunk(int64_t run_id, const ChunkRecord& c) {
  sqlite3_stmt* st = impl_->prepare(
    "INSERT INTO chunks (run_id, chunk_index, start_char, end_char, overlap_start_char,"
    " estimated_tokens, has_next) VALUES (?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT(run_id, chunk_index) DO UPDATE SET "
    " start_char=excluded.start_char, end_char=excluded.end_char,"
    " overlap_start_char=excluded.overlap_start_char,"
    " estimated_tokens=excluded.estimated_tokens, has_next=excluded.has_next;");
  sqlite3_bind_int64(st, 1, (sqlite3_int64)run_id);
  sqlite3_bind_int(st, 2, c.chunk_index);
  sqlite3_bind_int64(st, 3, (sqlite3_int64)c.start_char);
  sqlite3_bind_int64(st, 4, (sqlite3_int64)c.end_char);
  sqlite3_bind_int64(st, 5, (sqlite3_int64)c.overlap_start_char);
  sqlite3_bind_int(st, 6, c.estimated_tokens);
  sqlite3_bind_int(st, 7, c.has_next_chunk ? 1 : 0);

  if (sqlite3_step(st) != SQLITE_DONE) {
    sqlite3_finalize(st);
    throw std::runtime_error("sqlite insert chunk failed");
  }
  sqlite3_finalize(st);
}

ChunkRecord Store::get_chunk(int64_t run_id, int chunk_index) const {
  sqlite3_stmt* st = impl_->prepare(
    "SELECT chunk_index, start_char, end_char, overlap_start_char, estimated_tokens, has_next"
    " FROM chunks WHERE run_id=? AND chunk_index=?");
  sqlite3_bind_int64(st, 1, (sqlite3_int64)run_id);
  sqlite3_bind_int(st, 2, chunk_index);
  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    throw std::runtime_error("chunk not found");
  }
  ChunkRecord c = read_chunk_row(st);
  sqlite3_finalize(st);
  return c;
}

std::vector<ChunkRecord> Store::get_chunks(int64_t run_id) const {
  sqlite3_stmt* st = impl_->prepare(
    "SELECT chunk_index, start_char, end_char, overlap_start_char, estimated_tokens, has_next"
    " FROM chunks WHERE run_id=? ORDER BY chunk_index");
  sqlite3_bind_int64(st, 1, (sqlite3_int64)run_id);
  std::vector<ChunkRecord> out;
  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) out.push_back(read_chunk_row(st));
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite select chunks failed");
  return out;
}

int Store::run_count() const {
  sqlite3_stmt* st = impl_->prepare("SELECT COUNT(*) FROM runs");
  int n = 0;
  if (sqlite3_step(st) == SQLITE_ROW) n = sqlite3_column_int(st, 0);
  sqlite3_finalize(st);
  return n;
}
