/**
 * @file types.cpp
 * @brief Names, parsing and crop geometry for the core enumerations
 */

#include "obs_cutter/types.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>

#include <fmt/core.h>

#include "obs_cutter/config.hpp"

namespace obs_cutter {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // anonymous namespace

const char *to_string(QualityPreset quality) {
  switch (quality) {
  case QualityPreset::Lossless:
    return "lossless";
  case QualityPreset::High:
    return "high";
  case QualityPreset::Medium:
    return "medium";
  }
  return "lossless";
}

const char *to_string(SplitSide side) {
  return side == SplitSide::Left ? "left" : "right";
}

const char *codec_id(EncodingCapability capability) {
  switch (capability) {
  case EncodingCapability::PlatformNative:
    return "h264_videotoolbox";
  case EncodingCapability::VendorA:
    return "h264_nvenc";
  case EncodingCapability::VendorB:
    return "h264_qsv";
  case EncodingCapability::VendorC:
    return "h264_amf";
  case EncodingCapability::SoftwareOnly:
    return "libx264";
  }
  return "libx264";
}

const char *display_name(EncodingCapability capability) {
  switch (capability) {
  case EncodingCapability::PlatformNative:
    return "VideoToolbox (Apple)";
  case EncodingCapability::VendorA:
    return "NVENC (NVIDIA)";
  case EncodingCapability::VendorB:
    return "Quick Sync (Intel)";
  case EncodingCapability::VendorC:
    return "AMF (AMD)";
  case EncodingCapability::SoftwareOnly:
    return "Software (libx264)";
  }
  return "Software (libx264)";
}

std::string crop_filter(SplitSide side) {
  int x = side == SplitSide::Left ? 0 : HALF_WIDTH;
  return fmt::format("crop={}:{}:{}:0", HALF_WIDTH, HALF_HEIGHT, x);
}

std::optional<QualityPreset> parse_quality(const std::string &name,
                                           Status &status) {
  std::string lower = to_lower(name);
  if (lower == "lossless")
    return QualityPreset::Lossless;
  if (lower == "high")
    return QualityPreset::High;
  if (lower == "medium")
    return QualityPreset::Medium;

  status = Status::error(
      ErrorKind::InvalidQuality,
      fmt::format("Invalid quality preset: {}. Valid options: lossless, "
                  "high, medium",
                  name));
  return std::nullopt;
}

std::optional<SplitSide> parse_side(const std::string &name, Status &status) {
  std::string lower = to_lower(name);
  if (lower == "left")
    return SplitSide::Left;
  if (lower == "right")
    return SplitSide::Right;

  status = Status::error(
      ErrorKind::InvalidSide,
      fmt::format("Invalid side: {}. Valid options: left, right", name));
  return std::nullopt;
}

// **----- VideoDescriptor -----**

bool VideoDescriptor::has_expected_dimensions() const {
  return width == Config::expected_width() &&
         height == Config::expected_height();
}

std::string VideoDescriptor::aspect_ratio() const {
  if (width <= 0 || height <= 0)
    return "0:0";
  int g = std::gcd(width, height);
  return fmt::format("{}:{}", width / g, height / g);
}

} // namespace obs_cutter
