/**
 * @file capability_detector.hpp
 * @brief Hardware encoder detection
 *
 * @details Asks FFmpeg once for its encoder listing ("-encoders") and picks
 *          the first backend, in preference order, whose encoder identifier
 *          appears in it:
 *
 *          1. VideoToolbox (macOS builds only)
 *
 *          2. NVENC
 *
 *          3. Quick Sync
 *
 *          4. AMF
 *
 *          5. libx264 software fallback
 *
 * @note A failed probe means "no hardware", never an error.
 */

#ifndef OBS_CUTTER_CAPABILITY_DETECTOR_HPP
#define OBS_CUTTER_CAPABILITY_DETECTOR_HPP

#include <string>
#include <vector>

#include "process_runner.hpp"
#include "types.hpp"

namespace obs_cutter {

/// VideoToolbox is only attempted on Apple platforms
#ifdef __APPLE__
constexpr bool PLATFORM_NATIVE_SUPPORTED = true;
#else
constexpr bool PLATFORM_NATIVE_SUPPORTED = false;
#endif

/**
 * @class CapabilityDetector
 * @brief Probes which encoding backend is usable on this machine.
 */
class CapabilityDetector {
public:
  /**
   * @param runner Launcher used for the single probe invocation
   * @param ffmpeg_path FFmpeg binary to query
   * @param allow_platform_native Whether VideoToolbox may be attempted
   */
  CapabilityDetector(ProcessRunner &runner, std::string ffmpeg_path,
                     bool allow_platform_native = PLATFORM_NATIVE_SUPPORTED);

  /**
   * @brief Run the probe and select the best backend.
   * @note Exactly one subprocess spawn, no retries.
   */
  EncodingCapability detect();

  /**
   * @brief Pick the first candidate whose identifier occurs in listing.
   */
  static EncodingCapability select(const std::string &listing,
                                   bool allow_platform_native);

  /// Hardware candidates in preference order
  static std::vector<EncodingCapability> candidates(bool allow_platform_native);

private:
  ProcessRunner &runner_;
  std::string ffmpeg_path_;
  bool allow_platform_native_;
};

} // namespace obs_cutter

#endif // OBS_CUTTER_CAPABILITY_DETECTOR_HPP
