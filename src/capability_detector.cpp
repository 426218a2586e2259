/**
 * @file capability_detector.cpp
 * @brief Hardware encoder detection implementation
 */

#include "obs_cutter/capability_detector.hpp"

#include <utility>

#include "obs_cutter/logging.hpp"

namespace obs_cutter {

CapabilityDetector::CapabilityDetector(ProcessRunner &runner,
                                       std::string ffmpeg_path,
                                       bool allow_platform_native)
    : runner_(runner), ffmpeg_path_(std::move(ffmpeg_path)),
      allow_platform_native_(allow_platform_native) {}

std::vector<EncodingCapability>
CapabilityDetector::candidates(bool allow_platform_native) {
  std::vector<EncodingCapability> list;
  if (allow_platform_native)
    list.push_back(EncodingCapability::PlatformNative);
  list.push_back(EncodingCapability::VendorA);
  list.push_back(EncodingCapability::VendorB);
  list.push_back(EncodingCapability::VendorC);
  return list;
}

EncodingCapability CapabilityDetector::select(const std::string &listing,
                                              bool allow_platform_native) {
  for (EncodingCapability candidate : candidates(allow_platform_native)) {
    if (listing.find(codec_id(candidate)) != std::string::npos)
      return candidate;
  }
  return EncodingCapability::SoftwareOnly;
}

EncodingCapability CapabilityDetector::detect() {
  ProcessOutput out = runner_.run({ffmpeg_path_, "-hide_banner", "-encoders"});

  if (!out.started) {
    LOG_WARN("Encoder probe could not start ({}), using software encoding",
             out.spawn_error);
    return EncodingCapability::SoftwareOnly;
  }
  if (out.exit_code != 0) {
    LOG_WARN("Encoder probe exited with status {}, using software encoding",
             out.exit_code);
    return EncodingCapability::SoftwareOnly;
  }

  return select(out.stdout_text, allow_platform_native_);
}

} // namespace obs_cutter
