// src/turn_io.cpp
#include "turn_io.hpp"
#include "logging.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace {
std::string str_field(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return "";
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}

bool to_number(const json& v, double* out) {
  if (v.is_number()) { *out = v.get<double>(); return true; }
  if (v.is_string()) {
    const std::string s = v.get<std::string>();
    char* end = nullptr;
    double d = std::strtod(s.c_str(), &end);
    if (!s.empty() && end == s.c_str() + s.size()) { *out = d; return true; }
  }
  return false;
}

// Whole-range integer read; rejects non-numbers, NaN and values outside int.
bool to_int(const json& v, int* out) {
  double d = 0;
  if (!to_number(v, &d)) return false;
  if (!(d >= (double)std::numeric_limits<int>::min() && d <= (double)std::numeric_limits<int>::max()))
    return false;
  *out = (int)d;
  return true;
}

int int_field(const json& j, const char* key, int def) {
  auto it = j.find(key);
  int v = def;
  if (it != j.end() && !it->is_null() && !to_int(*it, &v)) return def;
  return v;
}

size_t size_field(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) return 0;
  double d = it->get<double>();
  if (!(d >= 0 && d <= (double)std::numeric_limits<int64_t>::max())) return 0;
  return (size_t)d;
}

bool bool_field(const json& j, const char* key, bool def) {
  auto it = j.find(key);
  return it != j.end() && it->is_boolean() ? it->get<bool>() : def;
}

const char* kRequiredTurnFields[] = {
  "idx", "start_ts", "end_ts", "speaker", "type", "question_likelihood", "text"
};
}

std::string extract_first_json_object(const std::string& text) {
  size_t start = text.find('{');
  while (start != std::string::npos) {
    int depth = 0;
    bool in_str = false, esc = false;
    for (size_t i = start; i < text.size(); ++i) {
      char c = text[i];
      if (in_str) {
        if (esc) esc = false;
        else if (c == '\\') esc = true;
        else if (c == '"') in_str = false;
        continue;
      }
      if (c == '"') in_str = true;
      else if (c == '{') depth++;
      else if (c == '}' && --depth == 0) {
        std::string cand = text.substr(start, i - start + 1);
        if (json::accept(cand)) return cand;
        break;
      }
    }
    start = text.find('{', start + 1);
  }
  return "";
}

Turn turn_from_json(const json& j) {
  Turn t;
  if (!j.is_object()) return t;

  auto idx = j.find("idx");
  if (idx != j.end() && !idx->is_null() && !to_int(*idx, &t.idx)) {
    log_warn("Invalid idx " + idx->dump() + " - defaulting to 0");
    t.idx = 0;
  }
  t.start_ts = str_field(j, "start_ts");
  t.end_ts = str_field(j, "end_ts");
  t.speaker = str_field(j, "speaker");
  t.text = str_field(j, "text");

  auto type_it = j.find("type");
  if (type_it != j.end() && type_it->is_string()) {
    bool known = false;
    t.type = parse_turn_type(type_it->get<std::string>(), &known);
    if (!known)
      log_warn("Unknown turn type '" + type_it->get<std::string>() + "' - defaulting to 'monologue'");
  } else {
    log_debug("Turn missing string type value; defaulting to 'monologue'");
  }

  auto ql = j.find("question_likelihood");
  if (ql != j.end()) {
    double d = 0;
    if (to_number(*ql, &d)) {
      t.question_likelihood = std::min(1.0, std::max(0.0, d));
    } else {
      log_warn("Invalid question_likelihood '" + ql->dump() + "' - defaulting to 0.0");
    }
  }
  return t;
}

json turn_to_json(const Turn& t) {
  return json{
    {"idx", t.idx},
    {"start_ts", t.start_ts},
    {"end_ts", t.end_ts},
    {"speaker", t.speaker},
    {"type", turn_type_name(t.type)},
    {"question_likelihood", t.question_likelihood},
    {"text", t.text},
  };
}

TurnsDocument parse_turns_document(const std::string& raw) {
  json j = json::parse(raw, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    auto obj = extract_first_json_object(raw);
    if (obj.empty()) throw std::runtime_error("no JSON object found in turns document");
    j = json::parse(obj);
  }

  TurnsDocument doc;
  const json* turns = nullptr;
  if (j.is_array()) {
    turns = &j;
  } else if (j.is_object()) {
    doc.meeting_id = str_field(j, "meeting_id");
    doc.time_zone = str_field(j, "time_zone");
    auto it = j.find("turns");
    if (it != j.end() && it->is_array()) turns = &*it;
  }
  if (!turns) {
    log_warn("turns document has no turns array");
    return doc;
  }
  for (auto& t : *turns) doc.turns.push_back(turn_from_json(t));
  return doc;
}

json turns_document_to_json(const TurnsDocument& doc) {
  json turns = json::array();
  for (auto& t : doc.turns) turns.push_back(turn_to_json(t));
  return json{{"meeting_id", doc.meeting_id}, {"time_zone", doc.time_zone}, {"turns", turns}};
}

std::vector<std::string> validate_turns(const json& doc) {
  static const RE2 hms("\\d{2}:\\d{2}:\\d{2}");
  std::vector<std::string> errors;
  if (!doc.is_object()) {
    errors.push_back("Data must be a JSON object");
    return errors;
  }
  for (const char* f : {"meeting_id", "time_zone", "turns"}) {
    if (!doc.contains(f)) errors.push_back(std::string("Missing required field: ") + f);
    else if (doc[f].is_null()) errors.push_back(std::string("Field '") + f + "' cannot be null");
  }
  if (!doc.contains("turns") || !doc["turns"].is_array()) return errors;

  const auto& turns = doc["turns"];
  for (size_t i = 0; i < turns.size(); ++i) {
    const std::string p = "Turn " + std::to_string(i) + ": ";
    const auto& t = turns[i];
    if (!t.is_object()) {
      errors.push_back("Turn " + std::to_string(i) + " must be an object");
      continue;
    }
    for (const char* f : kRequiredTurnFields) {
      if (!t.contains(f)) errors.push_back(p + "Missing required field: " + f);
      else if (t[f].is_null()) errors.push_back(p + "Field '" + f + "' cannot be null");
    }
    if (t.contains("type") && t["type"].is_string()) {
      bool known = false;
      TurnType tt = parse_turn_type(t["type"].get<std::string>(), &known);
      if (!known || t["type"].get<std::string>() != turn_type_name(tt))
        errors.push_back(p + "Invalid type '" + t["type"].get<std::string>() + "'");
    } else if (t.contains("type") && !t["type"].is_null()) {
      errors.push_back(p + "Invalid type " + t["type"].dump());
    }
    if (t.contains("question_likelihood") && !t["question_likelihood"].is_null()) {
      double d = 0;
      if (!to_number(t["question_likelihood"], &d))
        errors.push_back(p + "question_likelihood must be a number");
      else if (d < 0 || d > 1)
        errors.push_back(p + "question_likelihood must be between 0 and 1");
    }
    for (const char* f : {"start_ts", "end_ts"}) {
      if (t.contains(f) && t[f].is_string() && !RE2::FullMatch(t[f].get<std::string>(), hms))
        errors.push_back(p + f + " must be HH:MM:SS");
    }
  }
  return errors;
}

json segment_to_json(const Segment& s) {
  json j{
    {"id", s.id},
    {"start_time", nullptr},
    {"end_time", nullptr},
    {"topic", s.topic},
    {"speakers", s.speakers},
    {"text", s.text},
  };
  if (s.start_time) j["start_time"] = *s.start_time;
  if (s.end_time) j["end_time"] = *s.end_time;
  return j;
}

json segments_to_json(const std::vector<Segment>& segments) {
  json arr = json::array();
  for (auto& s : segments) arr.push_back(segment_to_json(s));
  return arr;
}

json manifest_to_json(const ChunkManifest& m) {
  json chunks = json::array();
  for (auto& c : m.chunks) {
    chunks.push_back(json{
      {"chunk_index", c.chunk_index},
      {"input_key", c.input_path},
      {"overlap_key", c.overlap_path.empty() ? json(nullptr) : json(c.overlap_path)},
      {"output_key", c.output_path},
      {"start_char", c.start_char},
      {"end_char", c.end_char},
      {"overlap_start_char", c.overlap_start_char},
      {"estimated_tokens", c.estimated_tokens},
      {"has_next_chunk", c.has_next_chunk},
    });
  }
  return json{
    {"meeting_id", m.meeting_id},
    {"original_input_key", m.original_input_path},
    {"chunked", m.chunked},
    {"chunk_count", m.chunk_count},
    {"total_chars", m.total_chars},
    {"estimated_total_tokens", m.estimated_total_tokens},
    {"chunking_params", {
      {"chunk_size_tokens", m.chunk_size_tokens},
      {"overlap_tokens", m.overlap_tokens},
    }},
    {"chunks", chunks},
    {"created_at", m.created_at},
  };
}

ChunkManifest manifest_from_json(const json& j) {
  if (!j.is_object()) throw std::runtime_error("chunk metadata must be a JSON object");
  ChunkManifest m;
  m.meeting_id = str_field(j, "meeting_id");
  m.original_input_path = str_field(j, "original_input_key");
  m.chunked = bool_field(j, "chunked", true);
  m.total_chars = size_field(j, "total_chars");
  m.estimated_total_tokens = int_field(j, "estimated_total_tokens", 0);
  m.created_at = str_field(j, "created_at");
  auto params = j.find("chunking_params");
  if (params != j.end() && params->is_object()) {
    m.chunk_size_tokens = int_field(*params, "chunk_size_tokens", 0);
    m.overlap_tokens = int_field(*params, "overlap_tokens", 0);
  }
  auto chunks = j.find("chunks");
  if (chunks != j.end() && chunks->is_array()) {
    for (size_t i = 0; i < chunks->size(); ++i) {
      const json& c = (*chunks)[i];
      if (!c.is_object())
        throw std::runtime_error("chunk metadata entry " + std::to_string(i) + " must be a JSON object");
      ChunkRecord r;
      r.chunk_index = int_field(c, "chunk_index", (int)i);
      r.input_path = str_field(c, "input_key");
      auto ov = c.find("overlap_key");
      if (ov != c.end() && ov->is_string()) r.overlap_path = ov->get<std::string>();
      r.output_path = str_field(c, "output_key");
      r.start_char = size_field(c, "start_char");
      r.end_char = size_field(c, "end_char");
      r.overlap_start_char = size_field(c, "overlap_start_char");
      r.estimated_tokens = int_field(c, "estimated_tokens", 0);
      r.has_next_chunk = bool_field(c, "has_next_chunk", false);
      m.chunks.push_back(std::move(r));
    }
  }
  m.chunk_count = int_field(j, "chunk_count", (int)m.chunks.size());
  return m;
}

json read_json_file(const std::string& path) {
  json j = json::parse(read_text_file(path), nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) throw std::runtime_error("invalid JSON in " + path);
  return j;
}

void write_json_file(const std::string& path, const json& j) {
  std::filesystem::path p(path);
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
  std::ofstream out(path, std::ios::binary);
  if (!out) throw std::runtime_error("cannot write " + path);
  out << j.dump(2) << "\n";
}
