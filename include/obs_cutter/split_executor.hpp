/**
 * @file split_executor.hpp
 * @brief FFmpeg execution for one half of one input
 *
 * @details Runs one crop-and-encode invocation:
 *
 *          - A reader worker drains FFmpeg's stderr, recovers logical lines
 *            (split on '\r' or '\n') and parses them into snapshots
 *
 *          - Snapshots cross to the calling thread through a
 *            ProgressChannel, which the caller polls so it can keep
 *            servicing its own events
 *
 *          - On failure the exit status and the trailing diagnostic lines
 *            are returned as the message
 */

#ifndef OBS_CUTTER_SPLIT_EXECUTOR_HPP
#define OBS_CUTTER_SPLIT_EXECUTOR_HPP

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "process_runner.hpp"
#include "progress_parser.hpp"
#include "types.hpp"

namespace obs_cutter {

/**
 * @struct SplitRequest
 * @brief Everything needed to encode one side.
 */
struct SplitRequest {
  std::string input_path;
  std::string output_path;
  SplitSide side = SplitSide::Left;
  QualityPreset quality = QualityPreset::Lossless;
  EncodingCapability capability = EncodingCapability::SoftwareOnly;
  std::optional<double> known_duration; //< From a prior probe, if any
};

using ProgressCallback = std::function<void(const EncodingProgress &)>;

/**
 * @class LineSplitter
 * @brief Reassembles logical lines from arbitrary stderr chunks.
 * @note FFmpeg rewrites its status line with '\r', so both '\r' and '\n'
 *       end a line. Empty fragments are dropped.
 */
class LineSplitter {
public:
  using LineCallback = std::function<void(const std::string &)>;

  /// Append a chunk and emit every line it completes
  void push(const char *data, size_t size, const LineCallback &on_line);

  /// Emit the unterminated remainder, if any
  void flush(const LineCallback &on_line);

private:
  std::string pending_;
};

/**
 * @class DiagnosticTail
 * @brief Bounded window of the most recent non-progress lines.
 */
class DiagnosticTail {
public:
  explicit DiagnosticTail(size_t capacity) : capacity_(capacity) {}

  void add(const std::string &line);
  std::string text() const;

private:
  size_t capacity_;
  std::deque<std::string> lines_;
};

/**
 * @class SplitExecutor
 * @brief Runs FFmpeg for one side and reports progress in order.
 */
class SplitExecutor {
public:
  SplitExecutor(ProcessRunner &runner, std::string ffmpeg_path);

  /**
   * @brief Command line: input, crop filter, codec args, -y, output.
   */
  std::vector<std::string> build_command(const SplitRequest &request) const;

  /**
   * @brief Encode one side.
   *
   * @param request What to encode
   * @param on_progress Called once per parsed snapshot, in arrival order,
   *        on the calling thread
   * @return Success, or SplitFailed carrying FFmpeg's diagnostics
   */
  Status run(const SplitRequest &request, const ProgressCallback &on_progress);

  /**
   * @brief Hook invoked whenever a poll interval passes without progress.
   * @note Lets a host event loop run while FFmpeg is busy.
   */
  void set_idle_callback(std::function<void()> on_idle) {
    on_idle_ = std::move(on_idle);
  }

private:
  ProcessRunner &runner_;
  std::string ffmpeg_path_;
  std::function<void()> on_idle_;
};

} // namespace obs_cutter

#endif // OBS_CUTTER_SPLIT_EXECUTOR_HPP
