/**
 * @file cli.hpp
 * @brief Command-line options for obs-cutter
 */

#ifndef OBS_CUTTER_CLI_HPP
#define OBS_CUTTER_CLI_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"

#define OBS_CUTTER_VERSION "0.3.0"

namespace obs_cutter {

/**
 * @struct CliOptions
 * @brief Parsed command line.
 */
struct CliOptions {
  std::vector<std::string> inputs; //< Videos, in the order given
  ProcessingConfig processing;
  bool show_help = false;
  bool show_version = false;
};

/**
 * @brief Parse argv into options.
 *
 * @param status InvalidQuality for a bad -q value, InvalidArgument for
 *        any other usage error
 * @return false on a usage error
 */
bool parse_arguments(int argc, char **argv, CliOptions &options,
                     Status &status);

/// Usage text for --help
std::string usage_text(const char *program_name);

} // namespace obs_cutter

#endif // OBS_CUTTER_CLI_HPP
