// Copyright (c) 2025
/**
 * @file time_source.hpp
 * @brief Minimal time source interface (UNIX time provider).
 */
#pragma once

#include <string>

#include "udpoffset/time_spec.hpp"

namespace udpoffset {

/**
 * Interface for time sources.
 * Provides current time as UNIX epoch time with nanosecond precision.
 *
 * Implementations must be safe to call concurrently from the send and
 * receive loops.
 */
class TimeSource {
 public:
  virtual ~TimeSource() = default;

  /**
   * @brief Reads the current time since the UNIX epoch.
   * @param out Current time on success; untouched on failure.
   * @return false if the underlying clock is unavailable.
   */
  virtual bool NowUnix(TimeSpec* out) = 0;

  /** Describes the most recent NowUnix() failure. */
  virtual std::string GetLastError() const { return "clock unavailable"; }
};

}  // namespace udpoffset
