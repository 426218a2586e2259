/**
 * @file process_runner.hpp
 * @brief Child process execution behind an injectable interface
 *
 * @details FFmpeg and FFprobe are reached only through ProcessRunner:
 *
 *          - run(): invoke and collect stdout / stderr (probes)
 *
 *          - stream(): invoke, discard stdout and hand stderr chunks to a
 *            callback while the child runs (splits)
 *
 *          Parsing and planning code never touches fork/exec directly, and
 *          tests substitute a scripted runner.
 */

#ifndef OBS_CUTTER_PROCESS_RUNNER_HPP
#define OBS_CUTTER_PROCESS_RUNNER_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace obs_cutter {

/**
 * @struct ProcessOutput
 * @brief Everything known about a finished child.
 */
struct ProcessOutput {
  bool started = false;    //< false if the binary could not be executed
  int exit_code = -1;      //< Exit status (128 + signal if killed)
  std::string stdout_text; //< Collected stdout (run() only)
  std::string stderr_text; //< Collected stderr (run() only)
  std::string spawn_error; //< Reason the child did not start

  bool success() const { return started && exit_code == 0; }
};

/// Receives raw stderr bytes exactly as read from the pipe
using ChunkCallback = std::function<void(const char *data, size_t size)>;

/**
 * @class ProcessRunner
 * @brief Abstract child-process launcher.
 */
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;

  /**
   * @brief Run argv[0] with arguments and wait for it.
   * @param argv Program followed by its arguments
   * @return Exit status and both collected output streams
   */
  virtual ProcessOutput run(const std::vector<std::string> &argv) = 0;

  /**
   * @brief Run argv[0], streaming stderr to on_stderr as it arrives.
   * @note stdout goes to /dev/null. The call returns after stderr is
   *       closed and the child has been reaped.
   */
  virtual ProcessOutput stream(const std::vector<std::string> &argv,
                               const ChunkCallback &on_stderr) = 0;
};

/**
 * @class PosixProcessRunner
 * @brief fork/execvp implementation with pipe capture.
 *
 * @attention ROBUSTNESS:
 *
 * - A close-on-exec status pipe reports exec failures as "not started"
 *
 * - stdout and stderr are drained together with poll() (no pipe deadlock)
 *
 * - Every descriptor is closed and the child reaped on all paths
 */
class PosixProcessRunner final : public ProcessRunner {
public:
  ProcessOutput run(const std::vector<std::string> &argv) override;
  ProcessOutput stream(const std::vector<std::string> &argv,
                       const ChunkCallback &on_stderr) override;

private:
  ProcessOutput execute(const std::vector<std::string> &argv,
                        bool capture_stdout, const ChunkCallback *on_stderr);
};

} // namespace obs_cutter

#endif // OBS_CUTTER_PROCESS_RUNNER_HPP
