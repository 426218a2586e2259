/**
 * @file progress_parser.cpp
 * @brief FFmpeg diagnostic line parsing
 */

#include "obs_cutter/progress_parser.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <regex>

namespace obs_cutter {

namespace {

const std::regex &duration_regex() {
  static const std::regex re(R"(Duration:\s*(\d{2,}):(\d{2}):(\d{2})\.(\d+))");
  return re;
}

const std::regex &time_regex() {
  static const std::regex re(R"(time=\s*(\d{2,}):(\d{2}):(\d{2})\.(\d+))");
  return re;
}

const std::regex &frame_regex() {
  static const std::regex re(R"(frame=\s*(\d+))");
  return re;
}

const std::regex &fps_regex() {
  static const std::regex re(R"(fps=\s*([\d.]+))");
  return re;
}

const std::regex &speed_regex() {
  static const std::regex re(R"(speed=\s*([\d.]+)x)");
  return re;
}

long to_long(const std::string &s) {
  char *end = nullptr;
  errno = 0;
  long v = std::strtol(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str())
    return 0;
  return v;
}

/// Malformed or missing fields read as zero
double to_double(const std::string &s) {
  char *end = nullptr;
  errno = 0;
  double v = std::strtod(s.c_str(), &end);
  if (errno != 0 || end == s.c_str())
    return 0;
  return v;
}

uint64_t to_u64(const std::string &s) {
  char *end = nullptr;
  errno = 0;
  unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str())
    return 0;
  return static_cast<uint64_t>(v);
}

std::optional<double> match_timestamp(const std::string &line,
                                      const std::regex &re) {
  std::smatch m;
  if (!std::regex_search(line, m, re))
    return std::nullopt;
  return timestamp_to_seconds(to_long(m[1]), to_long(m[2]), to_long(m[3]),
                              m[4]);
}

} // anonymous namespace

// **---- Field extraction ----**

double timestamp_to_seconds(long hours, long minutes, long seconds,
                            const std::string &fraction) {
  std::string hundredths = fraction.substr(0, 2);
  while (hundredths.size() < 2)
    hundredths.push_back('0');

  return hours * 3600.0 + minutes * 60.0 + seconds +
         to_long(hundredths) / 100.0;
}

std::optional<double> parse_duration(const std::string &line) {
  return match_timestamp(line, duration_regex());
}

std::optional<double> parse_timestamp(const std::string &line) {
  return match_timestamp(line, time_regex());
}

std::optional<EncodingProgress> parse_progress_line(const std::string &line,
                                                    double total_duration) {
  /// "time=" gates everything else
  auto current = parse_timestamp(line);
  if (!current)
    return std::nullopt;

  EncodingProgress p;
  p.current_seconds = *current;
  p.total_seconds = total_duration > 0 ? total_duration : 0;

  std::smatch m;
  if (std::regex_search(line, m, frame_regex()))
    p.frame = to_u64(m[1]);
  if (std::regex_search(line, m, fps_regex()))
    p.fps = to_double(m[1]);
  if (std::regex_search(line, m, speed_regex()))
    p.speed = to_double(m[1]);

  if (total_duration > 0)
    p.percentage = std::min(100.0, p.current_seconds / total_duration * 100.0);

  return p;
}

std::optional<double> EncodingProgress::eta_seconds() const {
  if (speed <= 0 || total_seconds <= 0)
    return std::nullopt;

  double remaining = total_seconds - current_seconds;
  if (remaining <= 0)
    return 0.0;
  return remaining / speed;
}

// **---- ProgressParser ----**

ProgressParser::ProgressParser(double known_duration) {
  if (known_duration > 0) {
    state_.total_duration = known_duration;
    state_.duration_known = true;
  }
}

std::optional<EncodingProgress> ProgressParser::feed(const std::string &line) {
  if (!state_.duration_known) {
    if (auto duration = parse_duration(line)) {
      state_.total_duration = *duration;
      state_.duration_known = true;
    }
  }

  return parse_progress_line(line, state_.total_duration);
}

} // namespace obs_cutter
