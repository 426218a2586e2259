/**
 * @file types.hpp
 * @brief Core data types and constants for obs-cutter
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - QualityPreset and EncodingCapability enumerations
 *
 *          - SplitSide with its fixed crop geometry
 *
 *          - VideoDescriptor produced by probing
 *
 *          - SplitResult for a completed input
 */

#ifndef OBS_CUTTER_TYPES_HPP
#define OBS_CUTTER_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "errors.hpp"

namespace obs_cutter {

// **----- CONSTANTS -----**

/**
 * @brief Geometry of one half of a side-by-side recording.
 * @note Crop rules are fixed and do not depend on the probed input size.
 */
constexpr int HALF_WIDTH = 1920;
constexpr int HALF_HEIGHT = 1080;

// **----- ENUMERATIONS -----**

/**
 * @brief Abstract encoding-fidelity tier, independent of the backend.
 */
enum class QualityPreset { Lossless, High, Medium };

/**
 * @brief Encoding backend, listed in detection preference order.
 * @note SoftwareOnly is always available and is the terminal fallback.
 */
enum class EncodingCapability {
  PlatformNative, //< VideoToolbox (macOS only)
  VendorA,        //< NVENC (NVIDIA)
  VendorB,        //< Quick Sync (Intel)
  VendorC,        //< AMF (AMD)
  SoftwareOnly    //< libx264
};

/**
 * @brief One of the two symmetric crop regions of a combined recording.
 */
enum class SplitSide { Left, Right };

const char *to_string(QualityPreset quality);
const char *to_string(SplitSide side);

/// FFmpeg encoder identifier, e.g. "h264_nvenc"
const char *codec_id(EncodingCapability capability);

/// Human-readable backend name, e.g. "NVENC (NVIDIA)"
const char *display_name(EncodingCapability capability);

inline bool is_hardware(EncodingCapability capability) {
  return capability != EncodingCapability::SoftwareOnly;
}

/**
 * @brief FFmpeg crop filter for a side ("crop=w:h:x:y").
 * @note Left origin is x=0, right origin is x=HALF_WIDTH.
 */
std::string crop_filter(SplitSide side);

/**
 * @brief Parse a quality preset name (case-insensitive).
 * @param name "lossless", "high" or "medium"
 * @param status Filled with InvalidQuality on failure
 */
std::optional<QualityPreset> parse_quality(const std::string &name,
                                           Status &status);

/**
 * @brief Parse a split side name (case-insensitive).
 * @param name "left" or "right"
 * @param status Filled with InvalidSide on failure
 */
std::optional<SplitSide> parse_side(const std::string &name, Status &status);

// **----- DATA STRUCTURES -----**

/**
 * @struct VideoDescriptor
 * @brief Probed description of an input video. Read-only after probing.
 */
struct VideoDescriptor {
  std::string path;                  //< Input path
  int width = 0;                     //< Width in pixels
  int height = 0;                    //< Height in pixels
  std::string codec;                 //< Codec name, e.g. "h264"
  std::optional<uint64_t> byte_size; //< On-disk size, if known

  /// True for the conventional 3840x1080 layout (configurable)
  bool has_expected_dimensions() const;

  /// Reduced aspect ratio, e.g. "32:9"
  std::string aspect_ratio() const;
};

/**
 * @struct SplitResult
 * @brief Outcome of one input whose two sides both completed.
 */
struct SplitResult {
  std::string input_path;
  std::string left_output;
  std::string right_output;
  uint64_t left_size = 0;
  uint64_t right_size = 0;
  std::chrono::milliseconds wall_clock{0};
  EncodingCapability capability = EncodingCapability::SoftwareOnly;
};

} // namespace obs_cutter

#endif // OBS_CUTTER_TYPES_HPP
