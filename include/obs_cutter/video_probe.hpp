/**
 * @file video_probe.hpp
 * @brief Input analysis through FFprobe
 *
 * @details Two probes are used per input:
 *
 *          - Stream description (JSON): first video stream carrying both
 *            width and height gives the VideoDescriptor
 *
 *          - Duration (plain text, seconds): seeds the progress parser so
 *            percentages do not wait for FFmpeg's "Duration:" line
 */

#ifndef OBS_CUTTER_VIDEO_PROBE_HPP
#define OBS_CUTTER_VIDEO_PROBE_HPP

#include <optional>
#include <string>

#include "errors.hpp"
#include "process_runner.hpp"
#include "types.hpp"

namespace obs_cutter {

/**
 * @class VideoProbe
 * @brief FFprobe front end bound to one runner and binary.
 */
class VideoProbe {
public:
  VideoProbe(ProcessRunner &runner, std::string ffprobe_path);

  /**
   * @brief Describe the first usable video stream of a file.
   * @param path Input video
   * @param status Filled with ProbeFailed on failure
   */
  std::optional<VideoDescriptor> describe(const std::string &path,
                                          Status &status);

  /**
   * @brief Container duration in seconds.
   * @param status Filled with ProbeFailed on failure
   */
  std::optional<double> duration(const std::string &path, Status &status);

private:
  ProcessRunner &runner_;
  std::string ffprobe_path_;
};

/**
 * @brief Decode FFprobe's "-of json" stream listing.
 * @note Exposed separately so the JSON contract is testable without a
 *       child process.
 */
std::optional<VideoDescriptor> parse_stream_listing(const std::string &text,
                                                    const std::string &path,
                                                    Status &status);

/// Parse the plain-text duration probe ("123.456000\n")
std::optional<double> parse_duration_output(const std::string &text);

} // namespace obs_cutter

#endif // OBS_CUTTER_VIDEO_PROBE_HPP
