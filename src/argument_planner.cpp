/**
 * @file argument_planner.cpp
 * @brief Per-backend rate-control mapping
 */

#include "obs_cutter/argument_planner.hpp"

namespace obs_cutter {

namespace {

/// Shared quality index for NVENC / Quick Sync / AMF
const char *quality_index(QualityPreset quality) {
  switch (quality) {
  case QualityPreset::High:
    return "18";
  case QualityPreset::Medium:
    return "23";
  case QualityPreset::Lossless:
    break;
  }
  return "15";
}

std::vector<std::string> videotoolbox_args(QualityPreset quality) {
  const char *bitrate = "25M";
  if (quality == QualityPreset::High)
    bitrate = "15M";
  else if (quality == QualityPreset::Medium)
    bitrate = "10M";

  return {"-c:v", codec_id(EncodingCapability::PlatformNative),
          "-b:v", bitrate,
          "-allow_sw", "1"};
}

std::vector<std::string> nvenc_args(QualityPreset quality) {
  const char *preset = quality == QualityPreset::Medium ? "p4" : "p7";
  return {"-c:v", codec_id(EncodingCapability::VendorA),
          "-preset", preset,
          "-cq", quality_index(quality)};
}

std::vector<std::string> qsv_args(QualityPreset quality) {
  return {"-c:v", codec_id(EncodingCapability::VendorB),
          "-global_quality", quality_index(quality),
          "-look_ahead", "1"};
}

std::vector<std::string> amf_args(QualityPreset quality) {
  return {"-c:v", codec_id(EncodingCapability::VendorC),
          "-rc", "cqp",
          "-qp_i", quality_index(quality),
          "-qp_p", quality_index(quality)};
}

std::vector<std::string> x264_args(QualityPreset quality) {
  const char *crf = "0";
  const char *preset = "veryslow";
  if (quality == QualityPreset::High) {
    crf = "18";
    preset = "slow";
  } else if (quality == QualityPreset::Medium) {
    crf = "23";
    preset = "medium";
  }
  return {"-c:v", codec_id(EncodingCapability::SoftwareOnly),
          "-crf", crf,
          "-preset", preset};
}

} // anonymous namespace

std::vector<std::string> plan_codec_arguments(QualityPreset quality,
                                              EncodingCapability capability) {
  std::vector<std::string> args;
  switch (capability) {
  case EncodingCapability::PlatformNative:
    args = videotoolbox_args(quality);
    break;
  case EncodingCapability::VendorA:
    args = nvenc_args(quality);
    break;
  case EncodingCapability::VendorB:
    args = qsv_args(quality);
    break;
  case EncodingCapability::VendorC:
    args = amf_args(quality);
    break;
  case EncodingCapability::SoftwareOnly:
    args = x264_args(quality);
    break;
  }

  /// Audio is passed through untouched
  args.push_back("-c:a");
  args.push_back("copy");
  return args;
}

bool is_approximate_lossless(QualityPreset quality,
                             EncodingCapability capability) {
  return quality == QualityPreset::Lossless && is_hardware(capability);
}

} // namespace obs_cutter
