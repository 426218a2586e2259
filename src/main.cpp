/**
 * @file main.cpp
 * @brief Entry point for obs-cutter
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Engine check with install hints when FFmpeg is missing
 *
 *          - Batch execution with a live single-line progress readout
 *
 * @note Ctrl+C requests cooperative cancellation: the side being encoded
 *       finishes, then the batch stops. A second Ctrl+C terminates.
 */

#include <chrono>
#include <csignal>
#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "obs_cutter/batch_orchestrator.hpp"
#include "obs_cutter/cli.hpp"
#include "obs_cutter/engine.hpp"
#include "obs_cutter/logging.hpp"
#include "obs_cutter/process_runner.hpp"
#include "obs_cutter/system.hpp"

using namespace obs_cutter;

namespace {

BatchOrchestrator *g_batch = nullptr;

void handle_interrupt(int) {
  if (g_batch)
    g_batch->cancel();
  std::signal(SIGINT, SIG_DFL);
}

void print_install_help() {
  fmt::print(fg(fmt::color::yellow), "\nTo install FFmpeg on macOS:\n");
  fmt::print("  brew install ffmpeg\n");
  fmt::print(fg(fmt::color::yellow), "\nOn Ubuntu/Debian:\n");
  fmt::print("  sudo apt-get install ffmpeg\n");
  fmt::print(fg(fmt::color::yellow), "\nOn Windows:\n");
  fmt::print("  Download from https://ffmpeg.org/download.html\n");
  fmt::print("\nOr point FFMPEG_PATH / FFPROBE_PATH at existing binaries.\n");
}

/// Live readout state: a '\r' line is open and must be ended before logging
bool g_progress_open = false;

void close_progress_line() {
  if (g_progress_open) {
    std::lock_guard<std::mutex> lock(log_mutex);
    fmt::print("\n");
    g_progress_open = false;
  }
}

void print_progress(size_t index, size_t total, SplitSide side,
                    const EncodingProgress &p) {
  std::lock_guard<std::mutex> lock(log_mutex);
  std::string position =
      total > 1 ? fmt::format("[{}/{}] ", index + 1, total) : std::string();
  fmt::print("\r{}{:<5} {:>5.1f}% | {} / {} | {:.0f} fps | {:.2f}x | ETA {:<14}",
             position, to_string(side), p.percentage,
             format_time(p.current_seconds), format_time(p.total_seconds),
             p.fps, p.speed, format_eta(p.eta_seconds()));
  std::fflush(stdout);
  g_progress_open = true;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  CliOptions options;
  Status status;
  if (!parse_arguments(argc, argv, options, status)) {
    LOG_ERROR("{}", status.message);
    fmt::print("{}", usage_text(argv[0]));
    return 2;
  }
  if (options.show_help) {
    fmt::print("{}", usage_text(argv[0]));
    return 0;
  }
  if (options.show_version) {
    fmt::print("obs-cutter {}\n", OBS_CUTTER_VERSION);
    return 0;
  }

  LOG_PHASE("OBS-Cutter - Video Splitter");
  LOG_PHASE("===========================");

  PosixProcessRunner runner;
  EnginePaths engine = resolve_engine_paths();

  if (!check_engine(runner, engine.ffmpeg, status) ||
      !check_engine(runner, engine.ffprobe, status)) {
    LOG_ERROR("{}", status.message);
    print_install_help();
    return 1;
  }
  if (auto version = engine_version(runner, engine.ffmpeg))
    LOG_INFO("{}{}", *version, is_bundled(engine.ffmpeg) ? " (bundled)" : "");

  if (!options.processing.use_hardware_accel)
    LOG_INFO("Hardware acceleration disabled by user");

  BatchObserver observer;
  observer.on_event = [](const BatchProgressEvent &) { close_progress_line(); };
  observer.on_encoding = print_progress;

  BatchOrchestrator batch(runner, engine, options.processing, options.inputs,
                          observer);

  g_batch = &batch;
  std::signal(SIGINT, handle_interrupt);

  auto batch_start = std::chrono::steady_clock::now();
  const BatchReport &report = batch.run();
  double elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - batch_start)
                           .count();

  std::signal(SIGINT, SIG_DFL);
  g_batch = nullptr;
  close_progress_line();

  print_batch_summary(report, elapsed_sec);
  TimingCollector::print_summary();

  Status outcome = report.outcome();
  if (outcome.kind == ErrorKind::Cancelled)
    LOG_WARN("{}", outcome.message);

  return report.all_succeeded() ? 0 : 1;
}
