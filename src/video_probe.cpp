/**
 * @file video_probe.cpp
 * @brief FFprobe invocation and output decoding
 */

#include "obs_cutter/video_probe.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace obs_cutter {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  size_t start = s.find_first_not_of(ws);
  if (start == std::string::npos)
    return {};
  size_t end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

Status probe_failure(const ProcessOutput &out, const std::string &path) {
  std::string reason;
  if (!out.started)
    reason = out.spawn_error;
  else if (!trim(out.stderr_text).empty())
    reason = trim(out.stderr_text);
  else
    reason = fmt::format("ffprobe exited with status {}", out.exit_code);

  return Status::error(ErrorKind::ProbeFailed,
                       fmt::format("Failed to analyze {}: {}", path, reason));
}

} // anonymous namespace

// **---- Output decoding ----**

std::optional<VideoDescriptor> parse_stream_listing(const std::string &text,
                                                    const std::string &path,
                                                    Status &status) {
  json root = json::parse(text, nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    status = Status::error(ErrorKind::ProbeFailed,
                           fmt::format("Malformed ffprobe output for {}", path));
    return std::nullopt;
  }

  auto streams = root.find("streams");
  if (streams == root.end() || !streams->is_array()) {
    status = Status::error(
        ErrorKind::ProbeFailed,
        fmt::format("ffprobe output for {} has no stream list", path));
    return std::nullopt;
  }

  for (const auto &stream : *streams) {
    if (!stream.is_object())
      continue;

    auto type = stream.find("codec_type");
    auto width = stream.find("width");
    auto height = stream.find("height");
    if (type == stream.end() || !type->is_string() || *type != "video")
      continue;
    if (width == stream.end() || !width->is_number_integer() ||
        height == stream.end() || !height->is_number_integer())
      continue;

    VideoDescriptor video;
    video.path = path;
    video.width = width->get<int>();
    video.height = height->get<int>();
    auto codec = stream.find("codec_name");
    if (codec != stream.end() && codec->is_string())
      video.codec = codec->get<std::string>();

    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (!ec)
      video.byte_size = static_cast<uint64_t>(size);

    return video;
  }

  status = Status::error(ErrorKind::ProbeFailed,
                         fmt::format("No video stream found in {}", path));
  return std::nullopt;
}

std::optional<double> parse_duration_output(const std::string &text) {
  std::string value = trim(text);
  if (value.empty())
    return std::nullopt;

  char *end = nullptr;
  errno = 0;
  double seconds = std::strtod(value.c_str(), &end);
  if (errno != 0 || *end != '\0' || !std::isfinite(seconds) || seconds < 0)
    return std::nullopt;
  return seconds;
}

// **---- VideoProbe ----**

VideoProbe::VideoProbe(ProcessRunner &runner, std::string ffprobe_path)
    : runner_(runner), ffprobe_path_(std::move(ffprobe_path)) {}

std::optional<VideoDescriptor> VideoProbe::describe(const std::string &path,
                                                    Status &status) {
  ProcessOutput out = runner_.run(
      {ffprobe_path_, "-v", "error", "-select_streams", "v:0",
       "-show_entries", "stream=width,height,codec_name,codec_type", "-of",
       "json", path});

  if (!out.success()) {
    status = probe_failure(out, path);
    return std::nullopt;
  }

  return parse_stream_listing(out.stdout_text, path, status);
}

std::optional<double> VideoProbe::duration(const std::string &path,
                                           Status &status) {
  ProcessOutput out = runner_.run(
      {ffprobe_path_, "-v", "error", "-show_entries", "format=duration", "-of",
       "default=noprint_wrappers=1:nokey=1", path});

  if (!out.success()) {
    status = probe_failure(out, path);
    return std::nullopt;
  }

  auto seconds = parse_duration_output(out.stdout_text);
  if (!seconds) {
    status = Status::error(
        ErrorKind::ProbeFailed,
        fmt::format("Failed to parse duration of {}: '{}'", path,
                    trim(out.stdout_text)));
  }
  return seconds;
}

} // namespace obs_cutter
