/**
 * @file errors.cpp
 * @brief Error kind names
 */

#include "obs_cutter/errors.hpp"

#include <fmt/core.h>

namespace obs_cutter {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "ok";
  case ErrorKind::EngineNotFound:
    return "engine-not-found";
  case ErrorKind::InputNotFound:
    return "input-not-found";
  case ErrorKind::ProbeFailed:
    return "probe-failed";
  case ErrorKind::InvalidQuality:
    return "invalid-quality";
  case ErrorKind::InvalidSide:
    return "invalid-side";
  case ErrorKind::SplitFailed:
    return "split-failed";
  case ErrorKind::OutputDirectoryFailed:
    return "output-directory-failed";
  case ErrorKind::Cancelled:
    return "cancelled";
  case ErrorKind::InvalidArgument:
    return "invalid-argument";
  }
  return "unknown";
}

std::string describe(const Status &status) {
  if (status.ok())
    return "ok";
  return fmt::format("{}: {}", to_string(status.kind), status.message);
}

} // namespace obs_cutter
