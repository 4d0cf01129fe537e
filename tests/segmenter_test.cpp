#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "segmenter.hpp"

namespace {

Turn turn(const std::string& speaker, const std::string& text,
          const std::string& start_ts = "00:00:00", const std::string& end_ts = "00:00:00") {
  Turn t;
  t.speaker = speaker;
  t.text = text;
  t.start_ts = start_ts;
  t.end_ts = end_ts;
  return t;
}

}  // namespace

TEST(Timestamp, ParsesHoursMinutesSeconds) {
  EXPECT_DOUBLE_EQ(*timestamp_to_seconds("01:02:03"), 3723.0);
  EXPECT_DOUBLE_EQ(*timestamp_to_seconds("00:00:01.5"), 1.5);
  EXPECT_DOUBLE_EQ(*timestamp_to_seconds("0:90:0"), 5400.0);
}

TEST(Timestamp, IgnoresWhitespaceAroundParts) {
  EXPECT_DOUBLE_EQ(*timestamp_to_seconds(" 00:01:00"), 60.0);
  EXPECT_DOUBLE_EQ(*timestamp_to_seconds("00:01:00 "), 60.0);
  EXPECT_DOUBLE_EQ(*timestamp_to_seconds("1 : 2 : 3"), 3723.0);
  EXPECT_FALSE(timestamp_to_seconds("1 0:00:00").has_value());
}

TEST(Timestamp, OutOfRangeNumberGivesNull) {
  EXPECT_FALSE(timestamp_to_seconds("00:01:1e400").has_value());
}

TEST(Timestamp, MalformedGivesNull) {
  EXPECT_FALSE(timestamp_to_seconds("").has_value());
  EXPECT_FALSE(timestamp_to_seconds("12:30").has_value());
  EXPECT_FALSE(timestamp_to_seconds("1:2:3:4").has_value());
  EXPECT_FALSE(timestamp_to_seconds("aa:bb:cc").has_value());
  EXPECT_FALSE(timestamp_to_seconds("01::03").has_value());
}

TEST(Segmenter, EmptyInputGivesNoSegments) {
  EXPECT_TRUE(create_segments({}).empty());
}

TEST(Segmenter, CutsBetweenTurnsAtCeiling) {
  // 20 chars -> 5 tokens each with the 4 chars/token estimate
  const std::string t20(20, 'w');
  std::vector<Turn> turns;
  for (int i = 0; i < 5; ++i) turns.push_back(turn("S" + std::to_string(i), t20));

  auto segs = create_segments(turns, 10);
  ASSERT_EQ(segs.size(), 3u);
  EXPECT_EQ(segs[0].id, 1);
  EXPECT_EQ(segs[1].id, 2);
  EXPECT_EQ(segs[2].id, 3);
  EXPECT_EQ(segs[0].turn_count, 2);
  EXPECT_EQ(segs[1].turn_count, 2);
  EXPECT_EQ(segs[2].turn_count, 1);
  EXPECT_EQ(segs[0].text, t20 + "\n" + t20);
  EXPECT_EQ(segs[0].topic, "Segment 1");
}

TEST(Segmenter, OversizedTurnGetsItsOwnSegment) {
  std::vector<Turn> turns = {
    turn("A", std::string(20, 'a')),
    turn("B", std::string(100, 'b')),
    turn("C", std::string(20, 'c')),
  };
  auto segs = create_segments(turns, 10);
  ASSERT_EQ(segs.size(), 3u);
  EXPECT_EQ(segs[1].text, std::string(100, 'b'));
  EXPECT_EQ(segs[1].turn_count, 1);
}

TEST(Segmenter, SingleLongTurnIsStillOneSegment) {
  auto segs = create_segments({turn("A", std::string(10000, 'x'))}, 10);
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_EQ(segs[0].turn_count, 1);
}

TEST(Segmenter, PreservesTurnOrderAndContent) {
  std::vector<Turn> turns;
  std::string all;
  for (int i = 0; i < 25; ++i) {
    turns.push_back(turn("S" + std::to_string(i % 4), "utterance number " + std::to_string(i)));
    if (i) all += "\n";
    all += turns.back().text;
  }
  auto segs = create_segments(turns, 12);
  ASSERT_GT(segs.size(), 1u);

  int total = 0;
  std::string joined;
  for (size_t i = 0; i < segs.size(); ++i) {
    EXPECT_GT(segs[i].turn_count, 0);
    EXPECT_EQ(segs[i].id, (int)i + 1);
    total += segs[i].turn_count;
    if (i) joined += "\n";
    joined += segs[i].text;
  }
  EXPECT_EQ(total, 25);
  EXPECT_EQ(joined, all);
}

TEST(Segmenter, SpeakersAreDistinctInFirstSeenOrder) {
  std::vector<Turn> turns = {
    turn("Bob", "one"), turn("Alice", "two"), turn("Bob", "three"), turn("", "four"),
  };
  auto segs = create_segments(turns, 3000);
  ASSERT_EQ(segs.size(), 1u);
  std::vector<std::string> expected = {"Bob", "Alice", "Unknown"};
  EXPECT_EQ(segs[0].speakers, expected);
}

TEST(Segmenter, TimeRangeFromFirstStartAndLastEnd) {
  std::vector<Turn> turns = {
    turn("A", "hello", "00:01:00", "00:01:10"),
    turn("B", "hi", "00:01:10", "00:02:30"),
  };
  auto segs = create_segments(turns);
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_DOUBLE_EQ(*segs[0].start_time, 60.0);
  EXPECT_DOUBLE_EQ(*segs[0].end_time, 150.0);

  turns[0].start_ts = "soon";
  turns[1].end_ts = "";
  segs = create_segments(turns);
  EXPECT_FALSE(segs[0].start_time.has_value());
  EXPECT_FALSE(segs[0].end_time.has_value());
}

TEST(Segmenter, UsesInjectedEstimator) {
  HeuristicTokenEstimator one_char_per_token(1);
  std::vector<Turn> turns = {turn("A", "abcde"), turn("B", "fghij")};
  EXPECT_EQ(create_segments(turns, 9, &one_char_per_token).size(), 2u);
  EXPECT_EQ(create_segments(turns, 10, &one_char_per_token).size(), 1u);
}
