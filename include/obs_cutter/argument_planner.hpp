/**
 * @file argument_planner.hpp
 * @brief Quality preset + backend -> FFmpeg codec arguments
 *
 * @details Each backend exposes a different rate-control knob:
 *
 *          - VideoToolbox: bitrate ceiling (-b:v)
 *
 *          - NVENC: constant-quality index (-cq) with a preset
 *
 *          - Quick Sync: global quality (-global_quality)
 *
 *          - AMF: constant QP pair (-qp_i / -qp_p)
 *
 *          - libx264: CRF with a speed preset
 *
 *          Audio is always stream-copied.
 *
 * @attention Lossless on a hardware backend maps to that backend's highest
 *            quality point. The result is not mathematically lossless.
 */

#ifndef OBS_CUTTER_ARGUMENT_PLANNER_HPP
#define OBS_CUTTER_ARGUMENT_PLANNER_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace obs_cutter {

/**
 * @brief Build the codec arguments for one split invocation.
 * @note Total: every (quality, capability) pair yields a non-empty list
 *       with exactly one "-c:v" selection and "-c:a copy".
 */
std::vector<std::string> plan_codec_arguments(QualityPreset quality,
                                              EncodingCapability capability);

/// True when the preset cannot be honoured exactly by the backend
bool is_approximate_lossless(QualityPreset quality,
                             EncodingCapability capability);

} // namespace obs_cutter

#endif // OBS_CUTTER_ARGUMENT_PLANNER_HPP
