#include <gtest/gtest.h>

#include "fake_process_runner.hpp"
#include "obs_cutter/capability_detector.hpp"

using namespace obs_cutter;
using namespace obs_cutter::test;

namespace {

const char *kListing =
    "Encoders:\n"
    " V....D libx264              libx264 H.264 / AVC / MPEG-4 AVC\n"
    " V....D h264_amf             AMD AMF H.264 Encoder (codec h264)\n"
    " V....D h264_qsv             H.264 / AVC (Intel Quick Sync Video)\n"
    " V....D h264_videotoolbox    VideoToolbox H.264 Encoder\n";

bool is_encoder_probe(const Argv &argv) { return has_arg(argv, "-encoders"); }

} // namespace

TEST(CapabilityDetectorTest, PicksFirstAvailableInPreferenceOrder) {
  FakeProcessRunner runner;
  runner.on(is_encoder_probe, {exited(0, kListing)});

  CapabilityDetector detector(runner, "ffmpeg", false);
  EXPECT_EQ(detector.detect(), EncodingCapability::VendorB);
  EXPECT_EQ(runner.count(is_encoder_probe), 1u);
}

TEST(CapabilityDetectorTest, PlatformNativeOnlyWhenAllowed) {
  EXPECT_EQ(CapabilityDetector::select(kListing, true),
            EncodingCapability::PlatformNative);
  EXPECT_EQ(CapabilityDetector::select(kListing, false),
            EncodingCapability::VendorB);
}

TEST(CapabilityDetectorTest, NvencPreferredOverOtherVendors) {
  std::string listing = std::string(kListing) +
                        " V....D h264_nvenc           NVIDIA NVENC H.264\n";
  EXPECT_EQ(CapabilityDetector::select(listing, false),
            EncodingCapability::VendorA);
}

TEST(CapabilityDetectorTest, NoHardwareMeansSoftware) {
  EXPECT_EQ(CapabilityDetector::select(" V....D libx264  libx264\n", true),
            EncodingCapability::SoftwareOnly);
}

TEST(CapabilityDetectorTest, FailedProbeFallsBackToSoftware) {
  FakeProcessRunner runner;
  runner.on(is_encoder_probe, {exited(1, kListing)});
  CapabilityDetector detector(runner, "ffmpeg", false);
  EXPECT_EQ(detector.detect(), EncodingCapability::SoftwareOnly);
  EXPECT_EQ(runner.calls().size(), 1u);
}

TEST(CapabilityDetectorTest, SpawnFailureFallsBackToSoftware) {
  FakeProcessRunner runner;
  runner.on(is_encoder_probe, {spawn_failure("No such file or directory")});
  CapabilityDetector detector(runner, "/missing/ffmpeg", false);
  EXPECT_EQ(detector.detect(), EncodingCapability::SoftwareOnly);
  EXPECT_EQ(runner.calls().size(), 1u);
}

TEST(CapabilityDetectorTest, CandidateOrder) {
  auto list = CapabilityDetector::candidates(true);
  ASSERT_EQ(list.size(), 4u);
  EXPECT_EQ(list.front(), EncodingCapability::PlatformNative);
  EXPECT_EQ(list.back(), EncodingCapability::VendorC);
  EXPECT_EQ(CapabilityDetector::candidates(false).size(), 3u);
}
