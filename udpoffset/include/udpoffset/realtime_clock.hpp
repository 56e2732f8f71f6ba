// Copyright (c) 2025
/**
 * @file realtime_clock.hpp
 * @brief POSIX realtime clock-based TimeSource implementation.
 *
 * Reads clock_gettime(CLOCK_REALTIME) directly on every call. The realtime
 * (wall-clock) source is used because the quantity of interest is the
 * absolute offset between two hosts.
 */
#pragma once

#include "udpoffset/export.hpp"
#include "udpoffset/time_source.hpp"

namespace udpoffset {

/**
 * @brief TimeSource backed by clock_gettime(CLOCK_REALTIME).
 *
 * Stateless apart from the last error text, which is thread-local, so
 * concurrent callers never contend.
 */
class UDP_OFFSET_API RealtimeClock : public TimeSource {
 public:
  RealtimeClock() = default;
  ~RealtimeClock() override = default;

  RealtimeClock(const RealtimeClock&) = delete;
  RealtimeClock& operator=(const RealtimeClock&) = delete;

  bool NowUnix(TimeSpec* out) override;
  std::string GetLastError() const override;

  /** Process-wide shared instance. */
  static RealtimeClock& Instance();
};

}  // namespace udpoffset
