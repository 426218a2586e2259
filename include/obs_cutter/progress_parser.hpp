/**
 * @file progress_parser.hpp
 * @brief Incremental parser for FFmpeg's diagnostic (stderr) output
 *
 * @details FFmpeg reports the input duration once ("Duration: 00:10:45.20")
 *          and then rewrites a status line while encoding:
 *
 *          frame= 1234 fps= 45 q=28.0 size= 18234kB time=00:00:45.67 ...
 *
 *          The parser turns each logical line into an EncodingProgress
 *          snapshot. Its only state is the set-once duration latch.
 */

#ifndef OBS_CUTTER_PROGRESS_PARSER_HPP
#define OBS_CUTTER_PROGRESS_PARSER_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace obs_cutter {

/**
 * @struct EncodingProgress
 * @brief One progress snapshot. Recomputed from scratch for every line.
 */
struct EncodingProgress {
  double current_seconds = 0; //< Position reached in the source video
  double total_seconds = 0;   //< Source duration (0 = unknown)
  uint64_t frame = 0;         //< Frames written so far
  double fps = 0;             //< Instantaneous encode rate
  double speed = 0;           //< Multiple of real time
  double percentage = 0;      //< Completion in [0, 100]

  /**
   * @brief Estimated seconds until the side finishes.
   * @return nullopt while speed or duration is unknown ("calculating")
   */
  std::optional<double> eta_seconds() const;
};

/**
 * @struct ParserState
 * @brief Duration latch. Once known, the duration is never replaced.
 */
struct ParserState {
  double total_duration = 0;
  bool duration_known = false;
};

/**
 * @brief Convert timestamp fields to seconds.
 * @note Only the first two fractional digits count (truncated), read as a
 *       decimal fraction: "20" and "205" give 0.20, "5" gives 0.50.
 */
double timestamp_to_seconds(long hours, long minutes, long seconds,
                            const std::string &fraction);

/// Extract "Duration: HH:MM:SS.ff" from a line
std::optional<double> parse_duration(const std::string &line);

/// Extract "time=HH:MM:SS.ff" from a line
std::optional<double> parse_timestamp(const std::string &line);

/**
 * @brief Parse a status line against a known total duration.
 * @return nullopt if the line carries no "time=" field
 */
std::optional<EncodingProgress> parse_progress_line(const std::string &line,
                                                    double total_duration);

/**
 * @class ProgressParser
 * @brief Stateful line parser owned by exactly one split invocation.
 */
class ProgressParser {
public:
  ProgressParser() = default;

  /// Seed with a duration obtained from a separate probe
  explicit ProgressParser(double known_duration);

  explicit ProgressParser(ParserState state) : state_(state) {}

  /**
   * @brief Feed one logical line.
   * @return A snapshot if the line is a progress line
   */
  std::optional<EncodingProgress> feed(const std::string &line);

  const ParserState &state() const { return state_; }

private:
  ParserState state_;
};

} // namespace obs_cutter

#endif // OBS_CUTTER_PROGRESS_PARSER_HPP
