/**
 * @file engine.hpp
 * @brief Locating and sanity-checking the FFmpeg / FFprobe binaries
 */

#ifndef OBS_CUTTER_ENGINE_HPP
#define OBS_CUTTER_ENGINE_HPP

#include <optional>
#include <string>

#include "errors.hpp"
#include "process_runner.hpp"

namespace obs_cutter {

/**
 * @struct EnginePaths
 * @brief Resolved binaries used for the whole run.
 */
struct EnginePaths {
  std::string ffmpeg = "ffmpeg";
  std::string ffprobe = "ffprobe";
};

/**
 * @brief Resolve both binaries from configuration and bundled copies.
 * @see resolve_engine_binary
 */
EnginePaths resolve_engine_paths();

/**
 * @brief Check that a binary runs ("<binary> -version" exits 0).
 * @param status Filled with EngineNotFound on failure
 * @return true if the binary is usable
 */
bool check_engine(ProcessRunner &runner, const std::string &binary,
                  Status &status);

/**
 * @brief First line of "<binary> -version", if it runs.
 */
std::optional<std::string> engine_version(ProcessRunner &runner,
                                          const std::string &binary);

} // namespace obs_cutter

#endif // OBS_CUTTER_ENGINE_HPP
