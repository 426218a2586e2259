/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables,
 *          plus the per-run ProcessingConfig assembled by the front end.
 *
 */

#ifndef OBS_CUTTER_CONFIG_HPP
#define OBS_CUTTER_CONFIG_HPP

#include <cerrno>
#include <cstdlib>
#include <optional>
#include <string>

#include "logging.hpp"
#include "types.hpp"

namespace obs_cutter {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or not a number
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  char *end = nullptr;
  errno = 0;
  long parsed = std::strtol(val, &end, 10);
  if (errno != 0 || *end != '\0') {
    LOG_WARN("Ignoring {}='{}' (not an integer), using {}", name, val,
             default_val);
    return default_val;
  }
  return static_cast<int>(parsed);
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @return Value, or empty string if unset
 */
inline std::string get_env_string(const char *name) {
  const char *val = std::getenv(name);
  return val ? std::string(val) : std::string();
}

/// Explicit FFmpeg binary (empty = resolve bundled / PATH)
inline const std::string &ffmpeg_override() {
  static std::string val = get_env_string("FFMPEG_PATH");
  return val;
}

/// Explicit FFprobe binary (empty = resolve bundled / PATH)
inline const std::string &ffprobe_override() {
  static std::string val = get_env_string("FFPROBE_PATH");
  return val;
}

/**
 * @brief Interval at which the control flow polls the progress channel.
 * @note Bounds the latency of cancellation and UI servicing while a side is
 *       being encoded.
 */
inline int progress_poll_ms() {
  static int val = get_env_int("PROGRESS_POLL_MS", 50);
  return val > 0 ? val : 50;
}

/// Width of a regular side-by-side recording
inline int expected_width() {
  static int val = get_env_int("EXPECTED_WIDTH", 3840);
  return val;
}

/// Height of a regular side-by-side recording
inline int expected_height() {
  static int val = get_env_int("EXPECTED_HEIGHT", 1080);
  return val;
}

/// Trailing FFmpeg diagnostic lines kept for failure messages
inline int diagnostic_tail_lines() {
  static int val = get_env_int("DIAGNOSTIC_TAIL_LINES", 20);
  return val > 0 ? val : 20;
}

} // namespace Config

/**
 * @struct ProcessingConfig
 * @brief Per-run settings chosen once by the front end.
 */
struct ProcessingConfig {
  QualityPreset quality = QualityPreset::Lossless;
  std::optional<std::string> output_format; //< Extension; input's if unset
  std::optional<std::string> output_dir;    //< Input's directory if unset
  bool use_hardware_accel = true;
  bool continue_on_error = false; //< Keep going after a failed file
};

} // namespace obs_cutter

#endif // OBS_CUTTER_CONFIG_HPP
