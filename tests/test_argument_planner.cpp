#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "obs_cutter/argument_planner.hpp"

using namespace obs_cutter;

namespace {

const QualityPreset kQualities[] = {QualityPreset::Lossless,
                                    QualityPreset::High, QualityPreset::Medium};
const EncodingCapability kCapabilities[] = {
    EncodingCapability::PlatformNative, EncodingCapability::VendorA,
    EncodingCapability::VendorB, EncodingCapability::VendorC,
    EncodingCapability::SoftwareOnly};

/// Value following the first occurrence of flag, or "" if absent
std::string value_of(const std::vector<std::string> &args,
                     const std::string &flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || it + 1 == args.end())
    return {};
  return *(it + 1);
}

} // namespace

TEST(ArgumentPlannerTest, EveryPairSelectsOneCodecAndCopiesAudio) {
  for (auto quality : kQualities) {
    for (auto capability : kCapabilities) {
      auto args = plan_codec_arguments(quality, capability);
      ASSERT_FALSE(args.empty());
      EXPECT_EQ(std::count(args.begin(), args.end(), "-c:v"), 1)
          << to_string(quality) << " / " << codec_id(capability);
      EXPECT_EQ(value_of(args, "-c:v"), codec_id(capability));
      EXPECT_EQ(value_of(args, "-c:a"), "copy");
    }
  }
}

TEST(ArgumentPlannerTest, SoftwareLosslessIsCrfZero) {
  auto args = plan_codec_arguments(QualityPreset::Lossless,
                                   EncodingCapability::SoftwareOnly);
  EXPECT_EQ(value_of(args, "-crf"), "0");
  EXPECT_EQ(value_of(args, "-preset"), "veryslow");

  args = plan_codec_arguments(QualityPreset::Medium,
                              EncodingCapability::SoftwareOnly);
  EXPECT_EQ(value_of(args, "-crf"), "23");
  EXPECT_EQ(value_of(args, "-preset"), "medium");
}

TEST(ArgumentPlannerTest, HardwareRateControlKnobs) {
  auto vt = plan_codec_arguments(QualityPreset::High,
                                 EncodingCapability::PlatformNative);
  EXPECT_EQ(value_of(vt, "-b:v"), "15M");

  auto nv =
      plan_codec_arguments(QualityPreset::Medium, EncodingCapability::VendorA);
  EXPECT_EQ(value_of(nv, "-cq"), "23");
  EXPECT_EQ(value_of(nv, "-preset"), "p4");

  auto qsv = plan_codec_arguments(QualityPreset::Lossless,
                                  EncodingCapability::VendorB);
  EXPECT_EQ(value_of(qsv, "-global_quality"), "15");

  auto amf =
      plan_codec_arguments(QualityPreset::High, EncodingCapability::VendorC);
  EXPECT_EQ(value_of(amf, "-qp_i"), "18");
  EXPECT_EQ(value_of(amf, "-qp_p"), "18");
}

TEST(ArgumentPlannerTest, ApproximateLosslessOnlyOnHardware) {
  EXPECT_TRUE(is_approximate_lossless(QualityPreset::Lossless,
                                      EncodingCapability::VendorA));
  EXPECT_FALSE(is_approximate_lossless(QualityPreset::Lossless,
                                       EncodingCapability::SoftwareOnly));
  EXPECT_FALSE(is_approximate_lossless(QualityPreset::High,
                                       EncodingCapability::VendorA));
}
