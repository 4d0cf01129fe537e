#include "similarity.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return s;
}

static std::string trim(const std::string& s) {
  auto a = s.find_first_not_of(" \t\r\n\f\v");
  auto b = s.find_last_not_of(" \t\r\n\f\v");
  if (a == std::string::npos) return "";
  return s.substr(a, b - a + 1);
}

std::string normalize_speaker(const std::string& speaker) {
  return to_lower(trim(speaker));
}

std::string normalize_text(const std::string& text) {
  static const RE2 ws("\\s+");
  std::string out = text;
  RE2::GlobalReplace(&out, ws, " ");
  return to_lower(trim(out));
}

static std::set<std::string> word_set(const std::string& normalized) {
  std::set<std::string> words;
  std::istringstream ss(normalized);
  std::string w;
  while (ss >> w) words.insert(w);
  return words;
}

double text_similarity(const std::string& a, const std::string& b) {
  const std::string na = normalize_text(a);
  const std::string nb = normalize_text(b);
  if (na == nb) return 1.0;

  auto wa = word_set(na);
  auto wb = word_set(nb);
  if (wa.empty() || wb.empty()) return 0.0;

  size_t common = 0;
  for (auto& w : wa) common += wb.count(w);
  const size_t uni = wa.size() + wb.size() - common;
  return (double)common / (double)uni;
}

bool is_duplicate_turn(const Turn& a, const Turn& b, double threshold) {
  if (normalize_speaker(a.speaker) != normalize_speaker(b.speaker)) return false;
  return text_similarity(a.text, b.text) >= threshold;
}

std::optional<size_t> find_duplicate_turn(const Turn& turn,
                                          const std::vector<Turn>& candidates,
                                          double threshold) {
  for (size_t i = 0; i < candidates.size(); ++i) {
    if (is_duplicate_turn(turn, candidates[i], threshold)) return i;
  }
  return std::nullopt;
}
