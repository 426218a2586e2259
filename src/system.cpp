/**
 * @file system.cpp
 * @brief System utilities implementation
 */

#include "obs_cutter/system.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>

namespace obs_cutter {

namespace fs = std::filesystem;

// **---- Engine discovery ----**

std::string executable_dir() {
  std::error_code ec;
  fs::path exe = fs::read_symlink("/proc/self/exe", ec);
  if (ec || exe.empty())
    return {};
  return exe.parent_path().string();
}

std::string resolve_engine_binary(const std::string &name,
                                  const std::string &override_path,
                                  const std::string &search_dir) {
  if (!override_path.empty())
    return override_path;

  if (!search_dir.empty()) {
    const fs::path base(search_dir);
    for (const fs::path &candidate :
         {base / name, base / "bin" / name, base / "lib" / name}) {
      std::error_code ec;
      if (fs::is_regular_file(candidate, ec))
        return candidate.string();
    }
  }

  return name;
}

bool is_bundled(const std::string &resolved_path) {
  const std::string dir = executable_dir();
  if (dir.empty())
    return false;
  return resolved_path.compare(0, dir.size(), dir) == 0;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_file_size(uint64_t bytes) {
  constexpr uint64_t KB = 1024;
  constexpr uint64_t MB = KB * 1024;
  constexpr uint64_t GB = MB * 1024;

  if (bytes >= GB)
    return fmt::format("{:.2f} GB", static_cast<double>(bytes) / GB);
  if (bytes >= MB)
    return fmt::format("{:.2f} MB", static_cast<double>(bytes) / MB);
  if (bytes >= KB)
    return fmt::format("{:.2f} KB", static_cast<double>(bytes) / KB);
  return fmt::format("{} B", bytes);
}

std::string format_duration(std::chrono::milliseconds duration) {
  long long total = duration.count() / 1000;
  long long hours = total / 3600;
  long long minutes = (total % 3600) / 60;
  long long seconds = total % 60;

  if (hours > 0)
    return fmt::format("{}h {}m {}s", hours, minutes, seconds);
  if (minutes > 0)
    return fmt::format("{}m {}s", minutes, seconds);
  return fmt::format("{}s", seconds);
}

std::string format_eta(std::optional<double> seconds) {
  if (!seconds)
    return "calculating...";

  double secs = *seconds;
  if (secs < 60.0)
    return fmt::format("~{}s", static_cast<long long>(secs));

  auto whole = static_cast<long long>(secs);
  if (secs < 3600.0)
    return fmt::format("~{}:{:02d}", whole / 60, whole % 60);
  return fmt::format("~{}h {:02d}m", whole / 3600, (whole % 3600) / 60);
}

} // namespace obs_cutter
