/**
 * @file batch_orchestrator.hpp
 * @brief Sequential batch state machine: analyze, split left, split right,
 *        collect
 *
 * @details The BatchOrchestrator owns an explicit tagged state and a single
 *          advance() step that a host loop calls repeatedly:
 *
 *          - AwaitingStart -> Analyzing(0), or Complete for an empty batch
 *
 *          - Analyzing(i) -> SplittingLeft(i) -> SplittingRight(i)
 *            -> Collecting(i) -> Analyzing(i+1) | Complete
 *
 *          - A failed file records a failure and moves on to the next index
 *            (or ends the batch when continue_on_error is off)
 *
 *          - Cancelled and Aborted are absorbing terminal states
 *
 * @note One engine process is active at a time. Sides and files never run
 *       in parallel.
 *
 * @attention cancel() may be called from any thread (signal handler, UI).
 *            It is observed only between files: a file whose analysis has
 *            started still encodes both sides and is collected.
 */

#ifndef OBS_CUTTER_BATCH_ORCHESTRATOR_HPP
#define OBS_CUTTER_BATCH_ORCHESTRATOR_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "config.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "process_runner.hpp"
#include "progress_parser.hpp"
#include "split_executor.hpp"
#include "types.hpp"
#include "video_probe.hpp"

namespace obs_cutter {

// **---- STATES ----**

namespace state {
struct AwaitingStart {};
struct Analyzing {
  size_t index;
};
struct SplittingLeft {
  size_t index;
};
struct SplittingRight {
  size_t index;
};
struct Collecting {
  size_t index;
};
struct Complete {};
struct Cancelled {};
struct Aborted {
  std::string message;
};
} // namespace state

using BatchState =
    std::variant<state::AwaitingStart, state::Analyzing, state::SplittingLeft,
                 state::SplittingRight, state::Collecting, state::Complete,
                 state::Cancelled, state::Aborted>;

/// True for Complete, Cancelled and Aborted
bool is_terminal(const BatchState &s);

/// Short state name for logs ("splitting-left", ...)
const char *state_name(const BatchState &s);

// **---- EVENTS ----**

namespace event {
struct Analyzing {
  std::string path;
};
struct Processing {
  SplitSide side;
  std::string path;
};
struct Completed {
  SplitResult result;
};
struct Failed {
  std::string path;
  std::string message;
};
} // namespace event

/**
 * @struct BatchProgressEvent
 * @brief One observer notification, tagged with its batch position.
 */
struct BatchProgressEvent {
  size_t index; //< Zero-based input index
  size_t total; //< Batch size
  std::variant<event::Analyzing, event::Processing, event::Completed,
               event::Failed>
      payload;
};

/**
 * @struct BatchObserver
 * @brief Outward surface. Callbacks run on the thread calling advance().
 */
struct BatchObserver {
  std::function<void(const BatchProgressEvent &)> on_event;
  std::function<void(size_t index, size_t total, SplitSide side,
                     const EncodingProgress &progress)>
      on_encoding;
  std::function<void()> on_idle; //< Poll interval elapsed without progress
};

struct FileFailure {
  size_t index;
  std::string path;
  Status status;
};

/**
 * @struct BatchReport
 * @brief Everything recorded so far. Results and failures are in index order.
 */
struct BatchReport {
  size_t total = 0;
  std::vector<SplitResult> results;
  std::vector<FileFailure> failures;
  bool cancelled = false;
  bool aborted = false;
  std::string abort_message;

  size_t succeeded() const { return results.size(); }
  size_t failed() const { return failures.size(); }

  /// Every input produced a result
  bool all_succeeded() const {
    return !cancelled && !aborted && failures.empty() &&
           results.size() == total;
  }

  /**
   * @brief How the batch as a whole ended.
   * @return OutputDirectoryFailed if aborted, Cancelled if cancelled,
   *         success otherwise (per-file failures live in failures)
   */
  Status outcome() const {
    if (aborted)
      return Status::error(ErrorKind::OutputDirectoryFailed, abort_message);
    if (cancelled)
      return Status::error(
          ErrorKind::Cancelled,
          "Batch cancelled; " + std::to_string(total - results.size() -
                                               failures.size()) +
              " file(s) not processed");
    return Status::success();
  }
};

/**
 * @brief Output path for one side of an input.
 * @details "<output_dir or input dir>/<stem>-<side>.<format or ext or mp4>"
 */
std::string plan_output_path(const std::string &input_path, SplitSide side,
                             const ProcessingConfig &config);

/**
 * @class BatchOrchestrator
 * @brief Drives a batch one state transition at a time.
 */
class BatchOrchestrator {
public:
  BatchOrchestrator(ProcessRunner &runner, EnginePaths engine,
                    ProcessingConfig config, std::vector<std::string> inputs,
                    BatchObserver observer = {});

  /**
   * @brief Perform one state transition.
   * @return false once a terminal state has been reached
   */
  bool advance();

  /// advance() until terminal, then return the report
  const BatchReport &run();

  /// Request cooperative cancellation (async-signal-safe)
  void cancel() { cancel_requested_.store(true); }

  bool cancel_requested() const { return cancel_requested_.load(); }

  const BatchState &state() const { return state_; }
  const BatchReport &report() const { return report_; }

  /// Capability chosen at batch start (SoftwareOnly before that)
  EncodingCapability capability() const { return capability_; }

  /**
   * @brief Skip detection and use a fixed capability.
   * @note Must be called before the first advance().
   */
  void set_capability(EncodingCapability capability) {
    capability_ = capability;
    capability_fixed_ = true;
  }

private:
  /// Scratch data for the file in flight
  struct FileContext {
    std::string left_output;
    std::string right_output;
    std::optional<double> duration;
    std::chrono::steady_clock::time_point started;
  };

  void start();
  void analyze(size_t index);
  void split(size_t index, SplitSide side);
  void collect(size_t index);

  void fail_file(size_t index, const Status &status);
  void next_file(size_t index);
  void emit(size_t index, decltype(BatchProgressEvent::payload) payload);

  ProcessRunner &runner_;
  EnginePaths engine_;
  ProcessingConfig config_;
  std::vector<std::string> inputs_;
  BatchObserver observer_;

  VideoProbe probe_;
  SplitExecutor executor_;

  BatchState state_;
  BatchReport report_;
  FileContext current_;
  EncodingCapability capability_ = EncodingCapability::SoftwareOnly;
  bool capability_fixed_ = false;
  std::atomic<bool> cancel_requested_{false};
};

/**
 * @brief Print the end-of-batch summary table.
 * @param wall_clock_sec Elapsed time for the whole batch
 */
void print_batch_summary(const BatchReport &report, double wall_clock_sec);

} // namespace obs_cutter

#endif // OBS_CUTTER_BATCH_ORCHESTRATOR_HPP
