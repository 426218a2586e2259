#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "obs_cutter/cli.hpp"

using namespace obs_cutter;

namespace {

/// Owns argv storage for parse_arguments
struct Args {
  explicit Args(std::vector<std::string> values) : storage(std::move(values)) {
    storage.insert(storage.begin(), "obs-cutter");
    for (auto &s : storage)
      pointers.push_back(&s[0]);
  }
  int argc() const { return static_cast<int>(pointers.size()); }
  char **argv() { return pointers.data(); }

  std::vector<std::string> storage;
  std::vector<char *> pointers;
};

} // namespace

TEST(CliTest, Defaults) {
  Args args({"rec.mkv"});
  CliOptions options;
  Status status;
  ASSERT_TRUE(parse_arguments(args.argc(), args.argv(), options, status));
  ASSERT_EQ(options.inputs.size(), 1u);
  EXPECT_EQ(options.inputs[0], "rec.mkv");
  EXPECT_EQ(options.processing.quality, QualityPreset::Lossless);
  EXPECT_TRUE(options.processing.use_hardware_accel);
  EXPECT_FALSE(options.processing.continue_on_error);
  EXPECT_FALSE(options.processing.output_dir.has_value());
  EXPECT_FALSE(options.processing.output_format.has_value());
}

TEST(CliTest, AllOptions) {
  Args args({"-q", "HIGH", "--format", "mp4", "-o", "/exports",
             "--no-hw-accel", "--continue-on-error", "a.mkv", "b.mkv"});
  CliOptions options;
  Status status;
  ASSERT_TRUE(parse_arguments(args.argc(), args.argv(), options, status));
  EXPECT_EQ(options.inputs, (std::vector<std::string>{"a.mkv", "b.mkv"}));
  EXPECT_EQ(options.processing.quality, QualityPreset::High);
  EXPECT_EQ(*options.processing.output_format, "mp4");
  EXPECT_EQ(*options.processing.output_dir, "/exports");
  EXPECT_FALSE(options.processing.use_hardware_accel);
  EXPECT_TRUE(options.processing.continue_on_error);
}

TEST(CliTest, InvalidQuality) {
  Args args({"-q", "ultra", "a.mkv"});
  CliOptions options;
  Status status;
  EXPECT_FALSE(parse_arguments(args.argc(), args.argv(), options, status));
  EXPECT_EQ(status.kind, ErrorKind::InvalidQuality);
  EXPECT_NE(status.message.find("lossless, high, medium"), std::string::npos);
}

TEST(CliTest, UsageErrors) {
  {
    Args args(std::vector<std::string>{});
    CliOptions options;
    Status status;
    EXPECT_FALSE(parse_arguments(args.argc(), args.argv(), options, status));
    EXPECT_EQ(status.kind, ErrorKind::InvalidArgument);
  }
  {
    Args args({"a.mkv", "--bogus"});
    CliOptions options;
    Status status;
    EXPECT_FALSE(parse_arguments(args.argc(), args.argv(), options, status));
    EXPECT_NE(status.message.find("--bogus"), std::string::npos);
  }
  {
    Args args({"a.mkv", "-o"});
    CliOptions options;
    Status status;
    EXPECT_FALSE(parse_arguments(args.argc(), args.argv(), options, status));
    EXPECT_EQ(status.kind, ErrorKind::InvalidArgument);
  }
}

TEST(CliTest, HelpAndVersionNeedNoInputs) {
  Args help({"--help"});
  CliOptions options;
  Status status;
  ASSERT_TRUE(parse_arguments(help.argc(), help.argv(), options, status));
  EXPECT_TRUE(options.show_help);
  EXPECT_NE(usage_text("obs-cutter").find("--continue-on-error"),
            std::string::npos);

  Args version({"-V"});
  CliOptions version_options;
  ASSERT_TRUE(
      parse_arguments(version.argc(), version.argv(), version_options, status));
  EXPECT_TRUE(version_options.show_version);
}

TEST(CliTest, DoubleDashEndsOptions) {
  Args args({"--", "-odd-name.mkv"});
  CliOptions options;
  Status status;
  ASSERT_TRUE(parse_arguments(args.argc(), args.argv(), options, status));
  EXPECT_EQ(options.inputs, (std::vector<std::string>{"-odd-name.mkv"}));
}
