#include <gtest/gtest.h>

#include "fake_process_runner.hpp"
#include "obs_cutter/engine.hpp"

using namespace obs_cutter;
using namespace obs_cutter::test;

TEST(EngineTest, WorkingBinary) {
  FakeProcessRunner runner;
  runner.on_args({"-version"},
                 {exited(0, "ffmpeg version 6.1.1 Copyright (c) 2000-2023\n"
                            "built with gcc 13\n")});

  Status status;
  EXPECT_TRUE(check_engine(runner, "ffmpeg", status));
  EXPECT_TRUE(status.ok());

  auto version = engine_version(runner, "ffmpeg");
  ASSERT_TRUE(version.has_value());
  EXPECT_EQ(*version, "ffmpeg version 6.1.1 Copyright (c) 2000-2023");
}

TEST(EngineTest, MissingBinary) {
  FakeProcessRunner runner;
  runner.on_args({"-version"}, {spawn_failure("No such file or directory")});

  Status status;
  EXPECT_FALSE(check_engine(runner, "ffmpeg", status));
  EXPECT_EQ(status.kind, ErrorKind::EngineNotFound);
  EXPECT_NE(status.message.find("No such file or directory"),
            std::string::npos);
  EXPECT_FALSE(engine_version(runner, "ffmpeg").has_value());
}

TEST(EngineTest, FailingBinary) {
  FakeProcessRunner runner;
  runner.on_args({"-version"}, {exited(126)});

  Status status;
  EXPECT_FALSE(check_engine(runner, "ffprobe", status));
  EXPECT_EQ(status.kind, ErrorKind::EngineNotFound);
  EXPECT_NE(status.message.find("status 126"), std::string::npos);
}
