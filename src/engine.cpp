/**
 * @file engine.cpp
 * @brief Engine binary resolution and availability checks
 */

#include "obs_cutter/engine.hpp"

#include <fmt/core.h>

#include "obs_cutter/config.hpp"
#include "obs_cutter/system.hpp"

namespace obs_cutter {

EnginePaths resolve_engine_paths() {
  const std::string dir = executable_dir();
  EnginePaths paths;
  paths.ffmpeg = resolve_engine_binary("ffmpeg", Config::ffmpeg_override(), dir);
  paths.ffprobe =
      resolve_engine_binary("ffprobe", Config::ffprobe_override(), dir);
  return paths;
}

bool check_engine(ProcessRunner &runner, const std::string &binary,
                  Status &status) {
  ProcessOutput out = runner.run({binary, "-version"});
  if (out.success())
    return true;

  std::string reason = out.started
                           ? fmt::format("exited with status {}", out.exit_code)
                           : out.spawn_error;
  status = Status::error(
      ErrorKind::EngineNotFound,
      fmt::format("{} is not installed or not found in PATH ({})", binary,
                  reason));
  return false;
}

std::optional<std::string> engine_version(ProcessRunner &runner,
                                          const std::string &binary) {
  ProcessOutput out = runner.run({binary, "-version"});
  if (!out.success())
    return std::nullopt;

  const std::string &text = out.stdout_text;
  std::string first = text.substr(0, text.find('\n'));
  if (first.empty())
    return std::nullopt;
  return first;
}

} // namespace obs_cutter
