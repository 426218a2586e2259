#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "fake_process_runner.hpp"
#include "obs_cutter/logging.hpp"
#include "obs_cutter/split_executor.hpp"

using namespace obs_cutter;
using namespace obs_cutter::test;

namespace {

SplitRequest left_request() {
  SplitRequest request;
  request.input_path = "/videos/clip.mkv";
  request.output_path = "/videos/clip-left.mkv";
  request.side = SplitSide::Left;
  request.quality = QualityPreset::High;
  request.capability = EncodingCapability::SoftwareOnly;
  return request;
}

std::vector<std::string> split_lines(const std::vector<std::string> &chunks) {
  std::vector<std::string> lines;
  LineSplitter splitter;
  auto collect = [&lines](const std::string &line) { lines.push_back(line); };
  for (const auto &chunk : chunks)
    splitter.push(chunk.data(), chunk.size(), collect);
  splitter.flush(collect);
  return lines;
}

} // namespace

TEST(LineSplitterTest, CarriageReturnAndNewlineBothEndLines) {
  auto lines = split_lines({"a\rb\nc\r\nd"});
  EXPECT_EQ(lines, (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST(LineSplitterTest, LinesSpanChunks) {
  auto lines = split_lines({"fra", "me=1 ti", "me=00:00:01.00\r", "\r", "x"});
  EXPECT_EQ(lines,
            (std::vector<std::string>{"frame=1 time=00:00:01.00", "x"}));
}

TEST(LineSplitterTest, EmptyFragmentsDropped) {
  EXPECT_TRUE(split_lines({"\r\r\n\n", ""}).empty());
}

TEST(DiagnosticTailTest, KeepsLastLines) {
  DiagnosticTail tail(2);
  tail.add("one");
  tail.add("two");
  tail.add("three");
  EXPECT_EQ(tail.text(), "two\nthree");
}

TEST(SplitExecutorTest, CommandLayout) {
  FakeProcessRunner runner;
  SplitExecutor executor(runner, "/opt/ffmpeg");
  auto cmd = executor.build_command(left_request());

  ASSERT_GE(cmd.size(), 8u);
  EXPECT_EQ(cmd[0], "/opt/ffmpeg");
  EXPECT_EQ(cmd[1], "-i");
  EXPECT_EQ(cmd[2], "/videos/clip.mkv");
  EXPECT_EQ(cmd[3], "-vf");
  EXPECT_EQ(cmd[4], "crop=1920:1080:0:0");
  EXPECT_EQ(cmd[cmd.size() - 2], "-y");
  EXPECT_EQ(cmd.back(), "/videos/clip-left.mkv");

  auto right = left_request();
  right.side = SplitSide::Right;
  EXPECT_EQ(executor.build_command(right)[4], "crop=1920:1080:1920:0");
}

TEST(SplitExecutorTest, ProgressDeliveredInOrder) {
  FakeProcessRunner runner;
  FakeResponse response;
  response.stderr_chunks = {
      "  Duration: 00:01:40.00, start: 0.0\n",
      "frame=10 fps=50 time=00:00:10.00 speed=1.0x\rframe=20 fps=50 ti",
      "me=00:00:20.00 speed=1.0x\r",
      "frame=30 fps=50 time=00:00:30.00 speed=1.0x"};
  runner.on_args({"-vf"}, response);

  SplitExecutor executor(runner, "ffmpeg");
  std::vector<double> seen;
  Status status = executor.run(left_request(), [&](const EncodingProgress &p) {
    seen.push_back(p.current_seconds);
    EXPECT_NEAR(p.total_seconds, 100.0, 1e-9);
  });

  EXPECT_TRUE(status.ok()) << status.message;
  ASSERT_EQ(seen.size(), 3u);
  EXPECT_NEAR(seen[0], 10.0, 1e-9);
  EXPECT_NEAR(seen[1], 20.0, 1e-9);
  EXPECT_NEAR(seen[2], 30.0, 1e-9);
}

TEST(SplitExecutorTest, KnownDurationSeedsParser) {
  FakeProcessRunner runner;
  FakeResponse response;
  response.stderr_chunks = {"time=00:00:30.00 speed=2.0x\n"};
  runner.on_args({"-vf"}, response);

  SplitExecutor executor(runner, "ffmpeg");
  auto request = left_request();
  request.known_duration = 90.0;

  std::vector<EncodingProgress> seen;
  Status status = executor.run(
      request, [&](const EncodingProgress &p) { seen.push_back(p); });

  ASSERT_TRUE(status.ok());
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_NEAR(seen[0].percentage, 100.0 / 3.0, 1e-9);
  ASSERT_TRUE(seen[0].eta_seconds().has_value());
  EXPECT_NEAR(*seen[0].eta_seconds(), 30.0, 1e-9);
}

TEST(SplitExecutorTest, NonZeroExitCarriesDiagnostics) {
  FakeProcessRunner runner;
  FakeResponse response;
  response.output = exited(1);
  response.stderr_chunks = {
      "time=00:00:01.00 speed=1.0x\r",
      "[h264_nvenc @ 0x55] No capable devices found\n",
      "Conversion failed!\n"};
  runner.on_args({"-vf"}, response);

  SplitExecutor executor(runner, "ffmpeg");
  int updates = 0;
  Status status = executor.run(left_request(),
                               [&](const EncodingProgress &) { ++updates; });

  EXPECT_EQ(status.kind, ErrorKind::SplitFailed);
  EXPECT_NE(status.message.find("exited with status 1"), std::string::npos);
  EXPECT_NE(status.message.find("No capable devices found"),
            std::string::npos);
  EXPECT_NE(status.message.find("Conversion failed!"), std::string::npos);
  EXPECT_EQ(status.message.find("time="), std::string::npos);
  EXPECT_EQ(updates, 1);
}

TEST(SplitExecutorTest, SpawnFailureIsReported) {
  FakeProcessRunner runner;
  runner.on_args({"-vf"}, {spawn_failure("execvp: No such file or directory")});

  SplitExecutor executor(runner, "ffmpeg");
  Status status = executor.run(left_request(), nullptr);

  EXPECT_EQ(status.kind, ErrorKind::SplitFailed);
  EXPECT_NE(status.message.find("No such file or directory"),
            std::string::npos);
  EXPECT_EQ(runner.calls().size(), 1u);
}

TEST(SplitExecutorTest, IdleHookRunsWhileWaiting) {
  FakeProcessRunner runner;
  FakeResponse response;
  response.side_effect = [](const Argv &) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  };
  runner.on_args({"-vf"}, response);

  SplitExecutor executor(runner, "ffmpeg");
  int idle = 0;
  executor.set_idle_callback([&idle]() { ++idle; });
  Status status = executor.run(left_request(), nullptr);

  EXPECT_TRUE(status.ok());
  EXPECT_GT(idle, 0);
}

TEST(SplitExecutorTest, RecordsTimingPerSide) {
  FakeProcessRunner runner;
  runner.on_args({"-vf"}, FakeResponse{});
  TimingCollector::clear();

  SplitExecutor executor(runner, "ffmpeg");
  ASSERT_TRUE(executor.run(left_request(), nullptr).ok());

  auto entries = TimingCollector::snapshot();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].name, "clip.mkv [left]");
  TimingCollector::clear();
}
