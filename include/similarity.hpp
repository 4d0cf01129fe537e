#pragma once
#include "turn.hpp"
#include <optional>
#include <string>
#include <vector>

constexpr double kDuplicateThreshold = 0.8;

// Trimmed, lower-cased speaker name.
std::string normalize_speaker(const std::string& speaker);

// Whitespace runs collapsed to one space, trimmed, lower-cased.
std::string normalize_text(const std::string& text);

// Jaccard similarity of the normalized word sets, in [0, 1]. Equal
// normalized texts score 1.0; an empty word set on either side scores 0.0.
double text_similarity(const std::string& a, const std::string& b);

// Same normalized speaker and text similarity >= threshold.
bool is_duplicate_turn(const Turn& a, const Turn& b, double threshold = kDuplicateThreshold);

// Index of the first candidate with the same speaker whose text is at least
// `threshold` similar, or nullopt.
std::optional<size_t> find_duplicate_turn(const Turn& turn,
                                          const std::vector<Turn>& candidates,
                                          double threshold = kDuplicateThreshold);
