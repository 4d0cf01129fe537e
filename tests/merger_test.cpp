#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "logging.hpp"
#include "merger.hpp"

namespace {

Turn make_turn(const std::string& speaker, const std::string& text,
               const std::string& start_ts = "", int idx = 0) {
  Turn t;
  t.idx = idx;
  t.speaker = speaker;
  t.text = text;
  t.start_ts = start_ts;
  t.end_ts = start_ts;
  return t;
}

ChunkManifest manifest_for(int chunk_count, int overlap_tokens = 2000) {
  ChunkManifest m;
  m.meeting_id = "m";
  m.chunk_count = chunk_count;
  m.chunk_size_tokens = 15000;
  m.overlap_tokens = overlap_tokens;
  for (int i = 0; i < chunk_count; ++i) {
    ChunkRecord r;
    r.chunk_index = i;
    r.has_next_chunk = i + 1 < chunk_count;
    m.chunks.push_back(r);
  }
  return m;
}

std::vector<std::string> texts(const std::vector<Turn>& turns) {
  std::vector<std::string> out;
  for (auto& t : turns) out.push_back(t.text);
  return out;
}

class MergerTest : public ::testing::Test {
protected:
  void SetUp() override { set_log_level(LogLevel::Off); }
  void TearDown() override { set_log_level(LogLevel::Info); }
};

}  // namespace

// ============================================================================
// Seam reconciliation
// ============================================================================

TEST_F(MergerTest, OverlappingMeetingChunksMergeToSixTurns) {
  std::map<int, std::vector<Turn>> results;
  results[0] = {
    make_turn("Alice", "Welcome everyone to the meeting"),
    make_turn("Bob", "Thanks Alice, glad to be here"),
    make_turn("Alice", "Let's start with the first topic"),
    make_turn("Charlie", "I have a question about that"),
  };
  results[1] = {
    make_turn("Alice", "Let's start with the first topic"),
    make_turn("Charlie", "I have a question about that"),
    make_turn("Alice", "Sure, go ahead Charlie"),
    make_turn("Charlie", "What's the timeline?"),
  };

  auto merged = merge_chunk_results(results, manifest_for(2));

  std::vector<std::string> expected = {
    "Welcome everyone to the meeting",
    "Thanks Alice, glad to be here",
    "Let's start with the first topic",
    "I have a question about that",
    "Sure, go ahead Charlie",
    "What's the timeline?",
  };
  EXPECT_EQ(texts(merged.turns), expected);
  for (size_t i = 0; i < merged.turns.size(); ++i) EXPECT_EQ(merged.turns[i].idx, (int)i);

  ASSERT_EQ(merged.stats.size(), 2u);
  EXPECT_EQ(merged.stats[0].added, 4);
  EXPECT_EQ(merged.stats[1].added, 2);
  EXPECT_EQ(merged.stats[1].merged, 2);
}

TEST_F(MergerTest, CountDropsByNumberOfSharedPairs) {
  std::map<int, std::vector<Turn>> results;
  results[0] = {
    make_turn("A", "one two three four five"),
    make_turn("B", "alpha beta gamma delta epsilon"),
    make_turn("A", "red green blue yellow purple"),
  };
  results[1] = {
    make_turn("B", "alpha beta gamma delta epsilon"),
    make_turn("A", "red green blue yellow purple"),
    make_turn("B", "north south east west"),
  };
  auto merged = merge_chunk_results(results, manifest_for(2));
  EXPECT_EQ(merged.turns.size(), 3u + 3u - 2u);
}

TEST_F(MergerTest, LongerVersionWinsAndEarlierStartKept) {
  std::map<int, std::vector<Turn>> results;
  results[0] = { make_turn("Alice", "Let's start with the first topic", "00:01:00") };
  results[1] = { make_turn("alice ", "Let's start with the first topic today", "00:00:59") };

  auto merged = merge_chunk_results(results, manifest_for(2));
  ASSERT_EQ(merged.turns.size(), 1u);
  EXPECT_EQ(merged.turns[0].text, "Let's start with the first topic today");
  EXPECT_EQ(merged.turns[0].start_ts, "00:00:59");
}

TEST_F(MergerTest, DifferentSpeakersAreNotDuplicates) {
  std::map<int, std::vector<Turn>> results;
  results[0] = { make_turn("Alice", "I agree with that") };
  results[1] = { make_turn("Bob", "I agree with that") };
  auto merged = merge_chunk_results(results, manifest_for(2));
  EXPECT_EQ(merged.turns.size(), 2u);
}

TEST_F(MergerTest, OnlyRecentWindowIsSearched) {
  std::map<int, std::vector<Turn>> results;
  results[0] = {
    make_turn("A", "we should ship on friday"),
    make_turn("B", "sounds good to me"),
  };
  results[1] = { make_turn("A", "we should ship on friday") };

  MergeConfig cfg;
  cfg.window_turns = 1;
  auto merged = merge_chunk_results(results, manifest_for(2), cfg);
  EXPECT_EQ(merged.turns.size(), 3u);

  cfg.window_turns = 2;
  merged = merge_chunk_results(results, manifest_for(2), cfg);
  EXPECT_EQ(merged.turns.size(), 2u);
}

TEST_F(MergerTest, TurnsOfTheSameChunkAreNotMergedTogether) {
  std::map<int, std::vector<Turn>> results;
  results[0] = { make_turn("A", "intro") };
  results[1] = {
    make_turn("A", "yes"),
    make_turn("A", "yes"),
  };
  auto merged = merge_chunk_results(results, manifest_for(2));
  EXPECT_EQ(merged.turns.size(), 3u);
}

TEST_F(MergerTest, PriorTurnAbsorbsAtMostOneDuplicate) {
  std::map<int, std::vector<Turn>> results;
  results[0] = { make_turn("A", "okay"), make_turn("B", "next item") };
  results[1] = { make_turn("A", "okay"), make_turn("A", "okay") };
  auto merged = merge_chunk_results(results, manifest_for(2));
  EXPECT_EQ(merged.turns.size(), 3u);
  EXPECT_EQ(merged.stats[1].merged, 1);
}

TEST_F(MergerTest, ThreeChunksInIndexOrderRegardlessOfArrival) {
  std::map<int, std::vector<Turn>> results;
  results[2] = { make_turn("C", "third part begins"), make_turn("C", "the end") };
  results[0] = { make_turn("A", "first part"), make_turn("B", "middle of first") };
  results[1] = { make_turn("B", "middle of first"), make_turn("C", "third part begins") };

  auto merged = merge_chunk_results(results, manifest_for(3));
  std::vector<std::string> expected = {
    "first part", "middle of first", "third part begins", "the end",
  };
  EXPECT_EQ(texts(merged.turns), expected);
}

// ============================================================================
// Degenerate inputs
// ============================================================================

TEST_F(MergerTest, NoChunksGiveNoTurns) {
  auto merged = merge_chunk_results({}, manifest_for(0));
  EXPECT_TRUE(merged.turns.empty());
}

TEST_F(MergerTest, SingleChunkPassesThroughUnchanged) {
  std::map<int, std::vector<Turn>> results;
  results[0] = {
    make_turn("A", "same", "", 5),
    make_turn("A", "same", "", 9),
  };
  auto merged = merge_chunk_results(results, manifest_for(1));
  ASSERT_EQ(merged.turns.size(), 2u);
  EXPECT_EQ(merged.turns[0].idx, 5);
  EXPECT_EQ(merged.turns[1].idx, 9);
}

TEST_F(MergerTest, EmptyChunkContributesNothing) {
  std::map<int, std::vector<Turn>> results;
  results[0] = { make_turn("A", "hello there") };
  results[1] = {};
  results[2] = { make_turn("B", "goodbye now") };
  auto merged = merge_chunk_results(results, manifest_for(3));
  EXPECT_EQ(merged.turns.size(), 2u);
}

TEST_F(MergerTest, MissingChunkResultAbortsMerge) {
  std::map<int, std::vector<Turn>> results;
  results[0] = { make_turn("A", "hello") };
  results[2] = { make_turn("A", "bye") };
  try {
    merge_chunk_results(results, manifest_for(3));
    FAIL() << "expected MissingChunkResult";
  } catch (const MissingChunkResult& e) {
    EXPECT_EQ(e.chunk_index(), 1);
  }
}

TEST_F(MergerTest, MalformedTurnsDoNotAbort) {
  std::map<int, std::vector<Turn>> results;
  results[0] = { Turn{}, make_turn("A", "real words here") };
  results[1] = { Turn{}, make_turn("", "") };
  auto merged = merge_chunk_results(results, manifest_for(2));
  EXPECT_GE(merged.turns.size(), 2u);
}

// ============================================================================
// Helpers
// ============================================================================

TEST(MergeWindow, DerivedFromOverlapAndCapped) {
  MergeConfig cfg;
  EXPECT_EQ(merge_window_turns(cfg, 2000), 30);   // 6000 chars / 200
  EXPECT_EQ(merge_window_turns(cfg, 10000), 50);  // capped
  EXPECT_EQ(merge_window_turns(cfg, 0), 1);
  cfg.window_turns = 7;
  EXPECT_EQ(merge_window_turns(cfg, 2000), 7);
}

TEST(MergeTurnData, TieKeepsExisting) {
  Turn a = make_turn("A", "same length one", "00:00:05");
  Turn b = make_turn("A", "same length two", "00:00:03");
  b.question_likelihood = 0.9;
  Turn m = merge_turn_data(a, b);
  EXPECT_EQ(m.text, "same length one");
  EXPECT_DOUBLE_EQ(m.question_likelihood, 0.0);
  EXPECT_EQ(m.start_ts, "00:00:03");
}

TEST(MergeTurnData, MissingTimestampLeavesKeptValue) {
  Turn a = make_turn("A", "short", "00:00:05");
  Turn b = make_turn("A", "a bit longer", "");
  Turn m = merge_turn_data(a, b);
  EXPECT_EQ(m.text, "a bit longer");
  EXPECT_EQ(m.start_ts, "");
}
