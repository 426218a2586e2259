/**
 * @file split_executor.cpp
 * @brief FFmpeg split execution implementation
 */

#include "obs_cutter/split_executor.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <thread>
#include <utility>

#include <fmt/core.h>

#include "obs_cutter/argument_planner.hpp"
#include "obs_cutter/config.hpp"
#include "obs_cutter/logging.hpp"
#include "obs_cutter/progress_channel.hpp"

namespace obs_cutter {

namespace {

/// Joins the reader on every exit path, including exceptions from callbacks
struct ThreadJoiner {
  std::thread &thread;
  ~ThreadJoiner() {
    if (thread.joinable())
      thread.join();
  }
};

} // anonymous namespace

// **----- LineSplitter -----**

void LineSplitter::push(const char *data, size_t size,
                        const LineCallback &on_line) {
  for (size_t i = 0; i < size; ++i) {
    char c = data[i];
    if (c == '\r' || c == '\n') {
      if (!pending_.empty()) {
        on_line(pending_);
        pending_.clear();
      }
    } else {
      pending_.push_back(c);
    }
  }
}

void LineSplitter::flush(const LineCallback &on_line) {
  if (!pending_.empty()) {
    on_line(pending_);
    pending_.clear();
  }
}

// **----- DiagnosticTail -----**

void DiagnosticTail::add(const std::string &line) {
  lines_.push_back(line);
  while (lines_.size() > capacity_)
    lines_.pop_front();
}

std::string DiagnosticTail::text() const {
  std::string joined;
  for (const auto &line : lines_) {
    if (!joined.empty())
      joined += '\n';
    joined += line;
  }
  return joined;
}

// **----- SplitExecutor -----**

SplitExecutor::SplitExecutor(ProcessRunner &runner, std::string ffmpeg_path)
    : runner_(runner), ffmpeg_path_(std::move(ffmpeg_path)) {}

std::vector<std::string>
SplitExecutor::build_command(const SplitRequest &request) const {
  std::vector<std::string> cmd{ffmpeg_path_, "-i", request.input_path, "-vf",
                               crop_filter(request.side)};

  auto codec = plan_codec_arguments(request.quality, request.capability);
  cmd.insert(cmd.end(), codec.begin(), codec.end());

  cmd.push_back("-y");
  cmd.push_back(request.output_path);
  return cmd;
}

Status SplitExecutor::run(const SplitRequest &request,
                          const ProgressCallback &on_progress) {
  const auto cmd = build_command(request);
  const std::string label =
      fmt::format("{} [{}]",
                  std::filesystem::path(request.input_path).filename().string(),
                  to_string(request.side));

  LOG_INFO("[FFmpeg] Encoding {} side with {} -> {}", to_string(request.side),
           codec_id(request.capability),
           std::filesystem::path(request.output_path).filename().string());

  TIMER_START(split_side);

  /// Per-invocation state: nothing leaks between sides or files
  ParserState seed;
  if (request.known_duration && *request.known_duration > 0) {
    seed.total_duration = *request.known_duration;
    seed.duration_known = true;
  }
  ProgressParser parser(seed);
  ProgressChannel channel;
  DiagnosticTail tail(static_cast<size_t>(Config::diagnostic_tail_lines()));
  ProcessOutput out;
  std::string reader_error;

  std::thread reader([&]() {
    try {
      LineSplitter splitter;
      auto on_line = [&](const std::string &line) {
        if (auto progress = parser.feed(line))
          channel.push(*progress);
        else
          tail.add(line);
      };
      out = runner_.stream(cmd, [&](const char *data, size_t size) {
        splitter.push(data, size, on_line);
      });
      splitter.flush(on_line);
    } catch (const std::exception &e) {
      reader_error = e.what();
    }
    channel.finish();
  });
  ThreadJoiner joiner{reader};

  /// Deliver snapshots on this thread, in the order they were parsed
  const auto poll = std::chrono::milliseconds(Config::progress_poll_ms());
  EncodingProgress progress;
  for (;;) {
    auto result = channel.pop_for(progress, poll);
    if (result == ProgressChannel::PopResult::Closed)
      break;
    if (result == ProgressChannel::PopResult::Item) {
      if (on_progress)
        on_progress(progress);
    } else if (on_idle_) {
      on_idle_();
    }
  }
  reader.join();

  TIMER_END(split_side, label);

  if (!reader_error.empty()) {
    return Status::error(ErrorKind::SplitFailed,
                         fmt::format("Reading FFmpeg output failed: {}",
                                     reader_error));
  }
  if (!out.started) {
    return Status::error(ErrorKind::SplitFailed,
                         fmt::format("FFmpeg could not be started: {}",
                                     out.spawn_error));
  }
  if (out.exit_code != 0) {
    std::string message =
        fmt::format("FFmpeg exited with status {}", out.exit_code);
    std::string diagnostics = tail.text();
    if (!diagnostics.empty())
      message += "\n" + diagnostics;
    return Status::error(ErrorKind::SplitFailed, message);
  }

  return Status::success();
}

} // namespace obs_cutter
