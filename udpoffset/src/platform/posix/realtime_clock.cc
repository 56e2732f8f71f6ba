// Copyright (c) 2025
/**
 * @file realtime_clock.cc
 * @brief POSIX-specific implementation using clock_gettime().
 */
#include "udpoffset/realtime_clock.hpp"

#include <time.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>

namespace udpoffset {

namespace {
thread_local std::string tls_last_error;
}  // namespace

bool RealtimeClock::NowUnix(TimeSpec* out) {
  if (out == nullptr) return false;

  timespec ts{};
  if (clock_gettime(CLOCK_REALTIME, &ts) != 0) {
    int err = errno;
    std::ostringstream oss;
    oss << "clock_gettime(CLOCK_REALTIME) failed (errno " << err << ": "
        << std::strerror(err) << ")";
    tls_last_error = oss.str();
    return false;
  }

  out->sec = static_cast<int64_t>(ts.tv_sec);
  out->nsec = static_cast<int64_t>(ts.tv_nsec);
  return true;
}

std::string RealtimeClock::GetLastError() const { return tls_last_error; }

RealtimeClock& RealtimeClock::Instance() {
  static RealtimeClock instance;
  return instance;
}

}  // namespace udpoffset
