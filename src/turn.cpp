#include "turn.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

const char* turn_type_name(TurnType t) {
  switch (t) {
    case TurnType::Question:     return "question";
    case TurnType::Answer:       return "answer";
    case TurnType::Followup:     return "followup";
    case TurnType::Monologue:    return "monologue";
    case TurnType::Housekeeping: return "housekeeping";
  }
  return "monologue";
}

TurnType parse_turn_type(const std::string& raw, bool* recognized) {
  static const std::unordered_map<std::string, TurnType> kTypes = {
    {"question", TurnType::Question},
    {"answer", TurnType::Answer},
    {"followup", TurnType::Followup},
    {"monologue", TurnType::Monologue},
    {"housekeeping", TurnType::Housekeeping},
    // synonyms seen in model output
    {"statement", TurnType::Monologue},
    {"comment", TurnType::Monologue},
    {"discussion", TurnType::Monologue},
    {"context", TurnType::Monologue},
    {"other", TurnType::Monologue},
    {"response", TurnType::Answer},
    {"reply", TurnType::Answer},
    {"follow-up", TurnType::Followup},
    {"follow up", TurnType::Followup},
    {"questioning", TurnType::Question},
  };

  auto a = raw.find_first_not_of(" \t\r\n");
  auto b = raw.find_last_not_of(" \t\r\n");
  std::string key = a == std::string::npos ? "" : raw.substr(a, b - a + 1);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });

  auto it = kTypes.find(key);
  if (recognized) *recognized = it != kTypes.end();
  return it != kTypes.end() ? it->second : TurnType::Monologue;
}
