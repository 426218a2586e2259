/**
 * @file progress_channel.hpp
 * @brief Thread-safe progress channel between the stderr reader and the
 *        control flow (single producer, single consumer)
 *
 * @details Keeps the control flow responsive while FFmpeg runs:
 *
 *          - The reader worker (producer) parses stderr and pushes snapshots
 *
 *          - The control flow (consumer) polls with a timeout, so it can
 *            service UI and cancellation between snapshots
 *
 *          - Unbounded and FIFO: nothing is dropped, merged or reordered
 */

#ifndef OBS_CUTTER_PROGRESS_CHANNEL_HPP
#define OBS_CUTTER_PROGRESS_CHANNEL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

#include "progress_parser.hpp"

namespace obs_cutter {

/**
 * @class ProgressChannel
 * @brief Unbounded FIFO of EncodingProgress snapshots.
 *
 * @attention USAGE:
 *
 *   - Reader worker calls push() per parsed snapshot
 *
 *   - Reader worker calls finish() once stderr is exhausted
 *
 *   - Control flow calls pop_for() until it returns Closed
 */
class ProgressChannel {
public:
  enum class PopResult { Item, Timeout, Closed };

  /**
   * @brief Push a snapshot to the channel.
   * @param progress The parsed snapshot
   */
  void push(EncodingProgress progress);

  /**
   * @brief Wait up to timeout for the next snapshot.
   * @param progress Output: the snapshot when Item is returned
   * @return Item, Timeout, or Closed once finished and drained
   */
  PopResult pop_for(EncodingProgress &progress,
                    std::chrono::milliseconds timeout);

  /**
   * @brief Signal that no more snapshots will be pushed.
   */
  void finish();

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<EncodingProgress> items_;
  std::atomic<bool> done_{false};
};

} // namespace obs_cutter

#endif // OBS_CUTTER_PROGRESS_CHANNEL_HPP
