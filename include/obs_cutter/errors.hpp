/**
 * @file errors.hpp
 * @brief Error kinds and the Status value passed back by fallible operations
 *
 * @details Operations report failure through a boolean or integer return and
 *          fill a Status out-parameter; nothing is thrown across module
 *          boundaries.
 */

#ifndef OBS_CUTTER_ERRORS_HPP
#define OBS_CUTTER_ERRORS_HPP

#include <string>
#include <utility>

namespace obs_cutter {

/**
 * @brief ErrorKind: every failure category the pipeline can report.
 */
enum class ErrorKind {
  None,
  EngineNotFound,        //< ffmpeg / ffprobe could not be run
  InputNotFound,         //< Input video does not exist
  ProbeFailed,           //< Bad JSON, no video stream or non-zero exit
  InvalidQuality,        //< Unknown quality preset name
  InvalidSide,           //< Unknown split side name
  SplitFailed,           //< Split invocation failed or could not start
  OutputDirectoryFailed, //< Output directory could not be created
  Cancelled,             //< Batch was cancelled
  InvalidArgument        //< Command-line usage error
};

/**
 * @struct Status
 * @brief Failure description: a kind plus a human-readable message.
 */
struct Status {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  bool ok() const { return kind == ErrorKind::None; }

  static Status success() { return {}; }
  static Status error(ErrorKind kind, std::string message) {
    return {kind, std::move(message)};
  }
};

/// Short name of an error kind, e.g. "split-failed"
const char *to_string(ErrorKind kind);

/// "<kind>: <message>" for logging
std::string describe(const Status &status);

} // namespace obs_cutter

#endif // OBS_CUTTER_ERRORS_HPP
