#include <gtest/gtest.h>

#include "obs_cutter/progress_parser.hpp"

using namespace obs_cutter;

namespace {

const char *kDurationLine =
    "  Duration: 00:01:30.00, start: 0.000000, bitrate: 60012 kb/s";
const char *kStatusLine = "frame=  900 fps=118 q=-1.0 size=   10240kB "
                          "time=00:00:30.00 bitrate=2796.2kbits/s speed=2.0x";

} // namespace

TEST(TimestampTest, TwoDigitFraction) {
  auto t = parse_timestamp("time=00:10:45.20");
  ASSERT_TRUE(t.has_value());
  EXPECT_NEAR(*t, 645.20, 1e-9);
}

TEST(TimestampTest, ShortFractionIsDecimal) {
  auto t = parse_timestamp("time=01:00:00.5");
  ASSERT_TRUE(t.has_value());
  EXPECT_NEAR(*t, 3600.50, 1e-9);
}

TEST(TimestampTest, ThreeDigitFractionTruncates) {
  EXPECT_NEAR(timestamp_to_seconds(0, 0, 1, "999"), 1.99, 1e-9);
  EXPECT_NEAR(timestamp_to_seconds(0, 10, 45, "205"), 645.20, 1e-9);
}

TEST(TimestampTest, DurationLine) {
  auto d = parse_duration(kDurationLine);
  ASSERT_TRUE(d.has_value());
  EXPECT_NEAR(*d, 90.0, 1e-9);
  EXPECT_FALSE(parse_duration("Stream #0:0: Video: h264").has_value());
}

TEST(ProgressLineTest, ExtractsAllFields) {
  auto p = parse_progress_line(kStatusLine, 90.0);
  ASSERT_TRUE(p.has_value());
  EXPECT_NEAR(p->current_seconds, 30.0, 1e-9);
  EXPECT_EQ(p->frame, 900u);
  EXPECT_DOUBLE_EQ(p->fps, 118.0);
  EXPECT_DOUBLE_EQ(p->speed, 2.0);
  EXPECT_NEAR(p->percentage, 100.0 / 3.0, 1e-9);
}

TEST(ProgressLineTest, TimeGatesEverything) {
  EXPECT_FALSE(
      parse_progress_line("frame=  900 fps=118 speed=2.0x", 90.0).has_value());
}

TEST(ProgressLineTest, MissingFieldsDefaultToZero) {
  auto p = parse_progress_line("size=N/A time=00:00:10.00 bitrate=N/A", 90.0);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->frame, 0u);
  EXPECT_DOUBLE_EQ(p->fps, 0.0);
  EXPECT_DOUBLE_EQ(p->speed, 0.0);
  EXPECT_FALSE(p->eta_seconds().has_value());
}

TEST(ProgressLineTest, MalformedSpeedFallsBackToZero) {
  auto p = parse_progress_line("time=00:00:10.00 speed=N/A", 90.0);
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(p->speed, 0.0);
}

TEST(ProgressLineTest, PercentageClampsAtHundred) {
  auto p = parse_progress_line("time=00:02:00.00 speed=1.0x", 90.0);
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(p->percentage, 100.0);
  ASSERT_TRUE(p->eta_seconds().has_value());
  EXPECT_DOUBLE_EQ(*p->eta_seconds(), 0.0);
}

TEST(EtaTest, RemainingOverSpeed) {
  EncodingProgress p;
  p.current_seconds = 30;
  p.total_seconds = 90;
  p.speed = 2.0;
  ASSERT_TRUE(p.eta_seconds().has_value());
  EXPECT_DOUBLE_EQ(*p.eta_seconds(), 30.0);

  p.speed = 0;
  EXPECT_FALSE(p.eta_seconds().has_value());
}

TEST(ProgressParserTest, DurationLatchesOnce) {
  ProgressParser parser;
  EXPECT_FALSE(parser.feed(kDurationLine).has_value());
  EXPECT_TRUE(parser.state().duration_known);

  for (int i = 0; i < 3; ++i) {
    auto p = parser.feed(kStatusLine);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->total_seconds, 90.0, 1e-9);
  }

  parser.feed("  Duration: 00:05:00.00, start: 0.000000");
  EXPECT_NEAR(parser.state().total_duration, 90.0, 1e-9);
  auto p = parser.feed(kStatusLine);
  ASSERT_TRUE(p.has_value());
  EXPECT_NEAR(p->total_seconds, 90.0, 1e-9);
}

TEST(ProgressParserTest, NoDurationLine) {
  ProgressParser parser;
  auto p = parser.feed(kStatusLine);
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(p->percentage, 0.0);
  EXPECT_FALSE(p->eta_seconds().has_value());
  EXPECT_FALSE(parser.state().duration_known);
}

TEST(ProgressParserTest, SeededDurationIgnoresLaterDurationLine) {
  ProgressParser parser(90.0);
  parser.feed("  Duration: 00:05:00.00, start: 0.000000");
  auto p = parser.feed(kStatusLine);
  ASSERT_TRUE(p.has_value());
  EXPECT_NEAR(p->total_seconds, 90.0, 1e-9);
  ASSERT_TRUE(p->eta_seconds().has_value());
  EXPECT_NEAR(*p->eta_seconds(), 30.0, 1e-9);
}

TEST(ProgressParserTest, InstancesDoNotShareState) {
  ProgressParser first;
  first.feed(kDurationLine);
  ProgressParser second;
  EXPECT_FALSE(second.state().duration_known);
}
