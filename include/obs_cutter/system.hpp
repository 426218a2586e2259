/**
 * @file system.hpp
 * @brief System utilities: engine binary discovery and formatting helpers
 *
 * @details Provides:
 *
 *          - Location of the running executable
 *
 *          - FFmpeg / FFprobe resolution (override, bundled copy, PATH)
 *
 *          - Time, size and ETA formatting for console output
 */

#ifndef OBS_CUTTER_SYSTEM_HPP
#define OBS_CUTTER_SYSTEM_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace obs_cutter {

// **---- Engine discovery ----**

/**
 * @brief Directory containing the running executable.
 * @return Empty string if it cannot be determined
 */
std::string executable_dir();

/**
 * @brief Resolve an engine binary ("ffmpeg" or "ffprobe").
 *
 * @note Resolution order:
 *
 *        1. override (FFMPEG_PATH / FFPROBE_PATH) when non-empty
 *
 *        2. bundled copy beside the executable, then in bin/ and lib/
 *
 *        3. the bare name, looked up in PATH at spawn time
 *
 * @param name Binary name without extension
 * @param override_path Explicit path from configuration (may be empty)
 * @param search_dir Directory to look for bundled copies in
 */
std::string resolve_engine_binary(const std::string &name,
                                  const std::string &override_path,
                                  const std::string &search_dir);

/// True when the resolved path points at a bundled copy rather than PATH
bool is_bundled(const std::string &resolved_path);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Format a byte count, e.g. "1.50 GB", "512 B".
 */
std::string format_file_size(uint64_t bytes);

/**
 * @brief Format an elapsed duration, e.g. "1h 2m 3s", "2m 3s", "3s".
 */
std::string format_duration(std::chrono::milliseconds duration);

/**
 * @brief Format a remaining-time estimate.
 * @return "~42s", "~3:07", "~1h 05m" or "calculating..." when unknown
 */
std::string format_eta(std::optional<double> seconds);

} // namespace obs_cutter

#endif // OBS_CUTTER_SYSTEM_HPP
