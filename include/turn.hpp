#pragma once
#include <string>
#include <vector>

enum class TurnType { Question, Answer, Followup, Monologue, Housekeeping };

struct Turn {
  int idx = 0;                // chunk-local until merged
  std::string start_ts;       // HH:MM:SS
  std::string end_ts;
  std::string speaker;
  TurnType type = TurnType::Monologue;
  double question_likelihood = 0.0;
  std::string text;
};

struct TurnsDocument {
  std::string meeting_id;
  std::string time_zone;
  std::vector<Turn> turns;
};

const char* turn_type_name(TurnType t);

// Maps model output ("statement", "reply", "Follow-up", ...) onto the five
// allowed types. Unknown values become Monologue and set *recognized=false.
TurnType parse_turn_type(const std::string& raw, bool* recognized = nullptr);
