/**
 * @file batch_orchestrator.cpp
 * @brief Batch state machine implementation
 *
 * @details Each advance() performs exactly one transition. Cancellation is
 *          checked first, so it is observed at every boundary and never
 *          interrupts an encode in progress.
 */

#include "obs_cutter/batch_orchestrator.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "obs_cutter/argument_planner.hpp"
#include "obs_cutter/capability_detector.hpp"
#include "obs_cutter/logging.hpp"
#include "obs_cutter/system.hpp"

namespace obs_cutter {

namespace fs = std::filesystem;

namespace {

uint64_t output_size(const std::string &path) {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if (ec) {
    LOG_WARN("Could not stat output {}: {}", path, ec.message());
    return 0;
  }
  return static_cast<uint64_t>(size);
}

} // anonymous namespace

bool is_terminal(const BatchState &s) {
  return std::holds_alternative<state::Complete>(s) ||
         std::holds_alternative<state::Cancelled>(s) ||
         std::holds_alternative<state::Aborted>(s);
}

namespace {

/// One overload per state, so a reordered variant cannot mislabel
struct StateNamer {
  const char *operator()(const state::AwaitingStart &) const {
    return "awaiting-start";
  }
  const char *operator()(const state::Analyzing &) const { return "analyzing"; }
  const char *operator()(const state::SplittingLeft &) const {
    return "splitting-left";
  }
  const char *operator()(const state::SplittingRight &) const {
    return "splitting-right";
  }
  const char *operator()(const state::Collecting &) const {
    return "collecting";
  }
  const char *operator()(const state::Complete &) const { return "complete"; }
  const char *operator()(const state::Cancelled &) const { return "cancelled"; }
  const char *operator()(const state::Aborted &) const { return "aborted"; }
};

} // anonymous namespace

const char *state_name(const BatchState &s) {
  return std::visit(StateNamer{}, s);
}

std::string plan_output_path(const std::string &input_path, SplitSide side,
                             const ProcessingConfig &config) {
  fs::path input(input_path);

  std::string ext;
  if (config.output_format && !config.output_format->empty()) {
    ext = *config.output_format;
    if (ext.front() == '.')
      ext.erase(0, 1);
  } else if (input.has_extension()) {
    ext = input.extension().string().substr(1);
  } else {
    ext = "mp4";
  }

  fs::path dir = config.output_dir ? fs::path(*config.output_dir)
                                   : input.parent_path();
  std::string name =
      fmt::format("{}-{}.{}", input.stem().string(), to_string(side), ext);
  return (dir / name).string();
}

// **---- ORCHESTRATOR ----**

BatchOrchestrator::BatchOrchestrator(ProcessRunner &runner, EnginePaths engine,
                                     ProcessingConfig config,
                                     std::vector<std::string> inputs,
                                     BatchObserver observer)
    : runner_(runner), engine_(std::move(engine)), config_(std::move(config)),
      inputs_(std::move(inputs)), observer_(std::move(observer)),
      probe_(runner_, engine_.ffprobe), executor_(runner_, engine_.ffmpeg) {
  report_.total = inputs_.size();
  if (observer_.on_idle)
    executor_.set_idle_callback(observer_.on_idle);
}

bool BatchOrchestrator::advance() {
  if (is_terminal(state_))
    return false;

  /// Only between files: a started file always runs through Collecting
  const bool at_file_boundary =
      std::holds_alternative<state::AwaitingStart>(state_) ||
      std::holds_alternative<state::Analyzing>(state_);
  if (at_file_boundary && cancel_requested_.load()) {
    LOG_WARN("Cancellation requested ({}), stopping batch",
             state_name(state_));
    state_ = state::Cancelled{};
    report_.cancelled = true;
    return false;
  }

  if (std::holds_alternative<state::AwaitingStart>(state_)) {
    start();
  } else if (auto *s = std::get_if<state::Analyzing>(&state_)) {
    analyze(s->index);
  } else if (auto *s = std::get_if<state::SplittingLeft>(&state_)) {
    split(s->index, SplitSide::Left);
  } else if (auto *s = std::get_if<state::SplittingRight>(&state_)) {
    split(s->index, SplitSide::Right);
  } else if (auto *s = std::get_if<state::Collecting>(&state_)) {
    collect(s->index);
  }

  return !is_terminal(state_);
}

const BatchReport &BatchOrchestrator::run() {
  while (advance()) {
  }
  return report_;
}

void BatchOrchestrator::start() {
  if (inputs_.empty()) {
    LOG_WARN("No input files to process");
    state_ = state::Complete{};
    return;
  }

  if (config_.output_dir) {
    std::error_code ec;
    fs::create_directories(*config_.output_dir, ec);
    if (ec) {
      Status status = Status::error(
          ErrorKind::OutputDirectoryFailed,
          fmt::format("Failed to create output directory {}: {}",
                      *config_.output_dir, ec.message()));
      LOG_ERROR("{}", status.message);
      report_.aborted = true;
      report_.abort_message = status.message;
      state_ = state::Aborted{status.message};
      return;
    }
  }

  if (!capability_fixed_) {
    if (config_.use_hardware_accel) {
      CapabilityDetector detector(runner_, engine_.ffmpeg);
      capability_ = detector.detect();
    } else {
      capability_ = EncodingCapability::SoftwareOnly;
    }
  }

  LOG_PHASE("================== SPLITTING {} FILE(S) ==================",
            inputs_.size());
  LOG_INFO("Encoder: {} ({})", display_name(capability_),
           codec_id(capability_));
  LOG_INFO("Quality: {}", to_string(config_.quality));
  if (is_approximate_lossless(config_.quality, capability_)) {
    LOG_WARN("Hardware encoders are not mathematically lossless; using a "
             "high-bitrate approximation");
  }

  state_ = state::Analyzing{0};
}

void BatchOrchestrator::analyze(size_t index) {
  const std::string &path = inputs_[index];
  current_ = FileContext{};
  current_.started = std::chrono::steady_clock::now();

  LOG_PHASE("---------------------------------------------------------");
  LOG_INFO("[{}/{}] Analyzing: {}", index + 1, inputs_.size(),
           fs::path(path).filename().string());
  emit(index, event::Analyzing{path});

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    fail_file(index, Status::error(ErrorKind::InputNotFound,
                                   fmt::format("Input not found: {}", path)));
    return;
  }

  Status status;
  auto descriptor = probe_.describe(path, status);
  if (!descriptor) {
    fail_file(index, status);
    return;
  }

  LOG_INFO("Resolution: {}x{} ({}), codec {}", descriptor->width,
           descriptor->height, descriptor->aspect_ratio(),
           descriptor->codec.empty() ? "unknown" : descriptor->codec);
  if (descriptor->byte_size)
    LOG_INFO("Size: {}", format_file_size(*descriptor->byte_size));
  if (!descriptor->has_expected_dimensions()) {
    LOG_WARN("Expected {}x{}, got {}x{}; the halves may not line up",
             Config::expected_width(), Config::expected_height(),
             descriptor->width, descriptor->height);
  }

  /// Best-effort: without it the parser waits for a Duration: line
  Status duration_status;
  current_.duration = probe_.duration(path, duration_status);
  if (current_.duration) {
    LOG_INFO("Duration: {}", format_time(*current_.duration));
  } else {
    LOG_WARN("Duration unknown, continuing: {}", duration_status.message);
  }

  current_.left_output = plan_output_path(path, SplitSide::Left, config_);
  current_.right_output = plan_output_path(path, SplitSide::Right, config_);

  state_ = state::SplittingLeft{index};
}

void BatchOrchestrator::split(size_t index, SplitSide side) {
  const std::string &path = inputs_[index];
  emit(index, event::Processing{side, path});

  SplitRequest request;
  request.input_path = path;
  request.output_path =
      side == SplitSide::Left ? current_.left_output : current_.right_output;
  request.side = side;
  request.quality = config_.quality;
  request.capability = capability_;
  request.known_duration = current_.duration;

  const size_t total = inputs_.size();
  Status status = executor_.run(
      request, [this, index, total, side](const EncodingProgress &progress) {
        if (observer_.on_encoding)
          observer_.on_encoding(index, total, side, progress);
      });

  if (!status.ok()) {
    fail_file(index, status);
    return;
  }

  if (side == SplitSide::Left)
    state_ = state::SplittingRight{index};
  else
    state_ = state::Collecting{index};
}

void BatchOrchestrator::collect(size_t index) {
  SplitResult result;
  result.input_path = inputs_[index];
  result.left_output = current_.left_output;
  result.right_output = current_.right_output;
  result.left_size = output_size(result.left_output);
  result.right_size = output_size(result.right_output);
  result.wall_clock = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - current_.started);
  result.capability = capability_;

  report_.results.push_back(result);
  emit(index, event::Completed{result});

  LOG_SUCCESS("[{}/{}] Completed in {}: left {}, right {}", index + 1,
              inputs_.size(), format_duration(result.wall_clock),
              format_file_size(result.left_size),
              format_file_size(result.right_size));
  next_file(index);
}

void BatchOrchestrator::fail_file(size_t index, const Status &status) {
  const std::string &path = inputs_[index];
  report_.failures.push_back({index, path, status});
  emit(index, event::Failed{path, status.message});

  LOG_ERROR("[{}/{}] Failed: {}", index + 1, inputs_.size(), describe(status));

  if (!config_.continue_on_error) {
    if (index + 1 < inputs_.size())
      LOG_WARN("Stopping after first failure (continue-on-error is off)");
    state_ = state::Complete{};
    return;
  }
  next_file(index);
}

void BatchOrchestrator::next_file(size_t index) {
  if (index + 1 < inputs_.size())
    state_ = state::Analyzing{index + 1};
  else
    state_ = state::Complete{};
}

void BatchOrchestrator::emit(size_t index,
                             decltype(BatchProgressEvent::payload) payload) {
  if (observer_.on_event)
    observer_.on_event(BatchProgressEvent{index, inputs_.size(),
                                          std::move(payload)});
}

// **---- SUMMARY ----**

void print_batch_summary(const BatchReport &report, double wall_clock_sec) {
  uint64_t bytes_written = 0;
  for (const auto &result : report.results)
    bytes_written += result.left_size + result.right_size;

  size_t untouched =
      report.total - report.succeeded() - report.failed();

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=================== SPLIT SUMMARY ===================\n");
  fmt::print("{:<25} {:>25}\n", "Total files:", report.total);
  fmt::print("{:<25} {:>25}\n", "Successful:", report.succeeded());
  fmt::print("{:<25} {:>25}\n", "Failed:", report.failed());
  if (untouched > 0)
    fmt::print("{:<25} {:>25}\n", "Not processed:", untouched);
  fmt::print("{:<25} {:>25}\n", "Output written:",
             format_file_size(bytes_written));
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  if (report.cancelled)
    fmt::print(fg(fmt::color::yellow), "{:<25} {:>25}\n", "Status:",
               "cancelled");
  if (report.aborted)
    fmt::print(fg(fmt::color::red), "{:<25} {:>25}\n", "Status:", "aborted");
  fmt::print(fg(fmt::color::cyan),
             "=====================================================\n");

  for (const auto &result : report.results) {
    fmt::print(fg(fmt::color::green), "  {}\n",
               fs::path(result.input_path).filename().string());
    fmt::print("    {} ({})\n", result.left_output,
               format_file_size(result.left_size));
    fmt::print("    {} ({})\n", result.right_output,
               format_file_size(result.right_size));
  }

  if (report.aborted)
    fmt::print(fg(fmt::color::red), "\nAborted: {}\n", report.abort_message);

  if (!report.failures.empty()) {
    fmt::print(fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &failure : report.failures) {
      fmt::print(fg(fmt::color::red), "  - {}: {}\n",
                 fs::path(failure.path).filename().string(),
                 failure.status.message);
    }
  }
  std::fflush(stdout);
}

} // namespace obs_cutter
