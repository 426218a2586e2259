/**
 * @file cli.cpp
 * @brief Command-line parsing
 */

#include "obs_cutter/cli.hpp"

#include <cstring>

#include <fmt/core.h>

#include "obs_cutter/types.hpp"

namespace obs_cutter {

namespace {

bool is_option(const char *arg, const char *short_name, const char *long_name) {
  return (short_name && std::strcmp(arg, short_name) == 0) ||
         (long_name && std::strcmp(arg, long_name) == 0);
}

/// Fetch the value following an option, or report it missing
bool take_value(int argc, char **argv, int &i, std::string &value,
                Status &status) {
  if (i + 1 >= argc) {
    status = Status::error(ErrorKind::InvalidArgument,
                           fmt::format("Option {} requires a value", argv[i]));
    return false;
  }
  value = argv[++i];
  return true;
}

} // anonymous namespace

bool parse_arguments(int argc, char **argv, CliOptions &options,
                     Status &status) {
  bool options_done = false;

  for (int i = 1; i < argc; ++i) {
    const char *arg = argv[i];

    if (options_done || arg[0] != '-' || std::strcmp(arg, "-") == 0) {
      options.inputs.emplace_back(arg);
      continue;
    }

    if (std::strcmp(arg, "--") == 0) {
      options_done = true;
    } else if (is_option(arg, "-h", "--help")) {
      options.show_help = true;
    } else if (is_option(arg, "-V", "--version")) {
      options.show_version = true;
    } else if (is_option(arg, "-f", "--format")) {
      std::string value;
      if (!take_value(argc, argv, i, value, status))
        return false;
      options.processing.output_format = value;
    } else if (is_option(arg, "-o", "--output")) {
      std::string value;
      if (!take_value(argc, argv, i, value, status))
        return false;
      options.processing.output_dir = value;
    } else if (is_option(arg, "-q", "--quality")) {
      std::string value;
      if (!take_value(argc, argv, i, value, status))
        return false;
      auto quality = parse_quality(value, status);
      if (!quality)
        return false;
      options.processing.quality = *quality;
    } else if (is_option(arg, nullptr, "--no-hw-accel")) {
      options.processing.use_hardware_accel = false;
    } else if (is_option(arg, nullptr, "--continue-on-error")) {
      options.processing.continue_on_error = true;
    } else {
      status = Status::error(ErrorKind::InvalidArgument,
                             fmt::format("Unknown option: {}", arg));
      return false;
    }
  }

  if (options.inputs.empty() && !options.show_help && !options.show_version) {
    status = Status::error(ErrorKind::InvalidArgument,
                           "At least one input video is required");
    return false;
  }

  status = Status::success();
  return true;
}

std::string usage_text(const char *program_name) {
  return fmt::format(
      "Usage: {} [options] VIDEO...\n"
      "\n"
      "Split 3840x1080 side-by-side recordings into two 1920x1080 videos.\n"
      "\n"
      "Options:\n"
      "  -f, --format FORMAT    Output container extension (default: input's)\n"
      "  -q, --quality PRESET   lossless | high | medium (default: lossless)\n"
      "  -o, --output DIR       Output directory (default: input's directory)\n"
      "      --no-hw-accel      Force software encoding (libx264)\n"
      "      --continue-on-error\n"
      "                         Keep going when a file fails\n"
      "  -h, --help             Show this help\n"
      "  -V, --version          Show version\n"
      "\n"
      "Environment:\n"
      "  FFMPEG_PATH, FFPROBE_PATH   Engine binaries to use\n"
      "  PROGRESS_POLL_MS            Progress poll interval (default 50)\n",
      program_name);
}

} // namespace obs_cutter
