#pragma once
#include "chunker.hpp"
#include "segmenter.hpp"
#include "turn.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

// First balanced {...} object in text (model output may wrap JSON in prose),
// or "" if there is none.
std::string extract_first_json_object(const std::string& text);

// Tolerant turn reader: missing or mistyped fields fall back to defaults,
// type synonyms are normalized and question_likelihood is clamped to [0, 1].
Turn turn_from_json(const json& j);
json turn_to_json(const Turn& t);

// Accepts {"meeting_id", "time_zone", "turns": [...]}, a bare array of turns,
// or either of those embedded in surrounding text. Throws std::runtime_error
// when no JSON can be recovered.
TurnsDocument parse_turns_document(const std::string& raw);
json turns_document_to_json(const TurnsDocument& doc);

// Schema problems of a turns document, one message each; empty when valid.
std::vector<std::string> validate_turns(const json& doc);

json segment_to_json(const Segment& s);
json segments_to_json(const std::vector<Segment>& segments);

json manifest_to_json(const ChunkManifest& m);
ChunkManifest manifest_from_json(const json& j);

json read_json_file(const std::string& path);
void write_json_file(const std::string& path, const json& j);
