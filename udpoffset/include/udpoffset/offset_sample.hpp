// Copyright (c) 2025
/**
 * @file offset_sample.hpp
 * @brief Offset bounds and midpoint from one timestamp exchange.
 *
 * Given the emitter send time t1, the reflector capture tau2 and the
 * emitter arrival time t3, the peer clock offset theta (peer minus local)
 * satisfies t1 - tau2 <= -theta <= t3 - tau2 when t1 <= t3. The midpoint
 * (t1 + t3) / 2 - tau2 is reported as the estimate.
 */
#pragma once

#include <string>

#include "udpoffset/time_spec.hpp"

namespace udpoffset {

/**
 * @brief One completed exchange and its derived offsets.
 *
 * Integer fields are exact; the *_s fields are the same values in seconds.
 */
struct OffsetSample {
  TimeSpec t1;    ///< Emitter send time (echoed by the reflector)
  TimeSpec tau2;  ///< Reflector capture time
  TimeSpec t3;    ///< Emitter arrival time of the reply

  Nanoseconds128 offset_min_ns = 0;  ///< t1 - tau2
  Nanoseconds128 offset_max_ns = 0;  ///< t3 - tau2

  double offset_min_s = 0.0;  ///< Lower bound (seconds)
  double offset_max_s = 0.0;  ///< Upper bound (seconds)
  double offset_s = 0.0;      ///< Midpoint estimate (seconds)
};

/**
 * @brief One-way record for a single request seen by the reflector.
 *
 * The delta mixes path delay and clock offset; it is reported as-is.
 */
struct ArrivalRecord {
  TimeSpec sent;            ///< Emitter capture carried in the request
  TimeSpec received;        ///< Reflector capture on arrival
  double one_way_s = 0.0;   ///< received - sent (seconds)
};

/**
 * @brief Compute the offset bounds and midpoint for one exchange.
 * @param t1 Emitter send time.
 * @param tau2 Reflector capture time.
 * @param t3 Emitter arrival time.
 * @return Populated sample.
 */
OffsetSample ComputeOffsetSample(const TimeSpec& t1, const TimeSpec& tau2,
                                 const TimeSpec& t3);

/** Build an ArrivalRecord from the request time and arrival time. */
ArrivalRecord ComputeArrivalRecord(const TimeSpec& sent,
                                   const TimeSpec& received);

/** Column header printed once before the first sample. */
std::string SampleHeader();

/**
 * @brief Format one sample as a CSV-style record (no trailing newline).
 *
 * Layout: "t1, tau2, t3, offset_min, offset_max, offset" where each
 * timestamp is sec.nnnnnnnnn and offsets have 9 fractional digits.
 */
std::string FormatSample(const OffsetSample& s);

/** Format a one-way record as "sent, received, one_way". */
std::string FormatArrival(const ArrivalRecord& r);

/** Format a timestamp as sec.nnnnnnnnn (9-digit zero-padded nsec). */
std::string FormatTimestamp(const TimeSpec& ts);

}  // namespace udpoffset
