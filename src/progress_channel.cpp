/**
 * @file progress_channel.cpp
 * @brief Progress channel implementation
 */

#include "obs_cutter/progress_channel.hpp"

#include <utility>

namespace obs_cutter {

void ProgressChannel::push(EncodingProgress progress) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.push(std::move(progress));
  }
  cv_.notify_one();
}

ProgressChannel::PopResult
ProgressChannel::pop_for(EncodingProgress &progress,
                         std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout,
               [this] { return !items_.empty() || done_.load(); });

  if (items_.empty()) {
    return done_.load() ? PopResult::Closed : PopResult::Timeout;
  }

  progress = std::move(items_.front());
  items_.pop();
  return PopResult::Item;
}

void ProgressChannel::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

} // namespace obs_cutter
