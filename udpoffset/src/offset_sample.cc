// Copyright (c) 2025
/**
 * @file offset_sample.cc
 * @brief Offset arithmetic and record formatting.
 */
#include "udpoffset/offset_sample.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace udpoffset {

namespace {

void AppendSeconds(std::ostringstream* oss, double v) {
  *oss << std::fixed << std::setprecision(9) << v;
}

}  // namespace

OffsetSample ComputeOffsetSample(const TimeSpec& t1, const TimeSpec& tau2,
                                 const TimeSpec& t3) {
  OffsetSample s;
  s.t1 = t1;
  s.tau2 = tau2;
  s.t3 = t3;

  s.offset_min_ns = DiffNanoseconds(t1, tau2);
  s.offset_max_ns = DiffNanoseconds(t3, tau2);

  s.offset_min_s = ToSeconds(s.offset_min_ns);
  s.offset_max_s = ToSeconds(s.offset_max_ns);
  // Mean of the reported bounds, so the printed midpoint matches them.
  s.offset_s = (s.offset_min_s + s.offset_max_s) / 2.0;
  return s;
}

ArrivalRecord ComputeArrivalRecord(const TimeSpec& sent,
                                   const TimeSpec& received) {
  ArrivalRecord r;
  r.sent = sent;
  r.received = received;
  r.one_way_s = ToSeconds(DiffNanoseconds(received, sent));
  return r;
}

std::string SampleHeader() {
  return "t1, tau2, t3, offset_min, offset_max, offset";
}

std::string FormatTimestamp(const TimeSpec& ts) {
  std::ostringstream oss;
  // nsec is printed as received; a negative value keeps its sign in front.
  oss << ts.sec << "." << std::setw(9) << std::setfill('0') << std::internal
      << ts.nsec;
  return oss.str();
}

std::string FormatSample(const OffsetSample& s) {
  std::ostringstream oss;
  oss << FormatTimestamp(s.t1) << ", " << FormatTimestamp(s.tau2) << ", "
      << FormatTimestamp(s.t3) << ", ";
  AppendSeconds(&oss, s.offset_min_s);
  oss << ", ";
  AppendSeconds(&oss, s.offset_max_s);
  oss << ", ";
  AppendSeconds(&oss, s.offset_s);
  return oss.str();
}

std::string FormatArrival(const ArrivalRecord& r) {
  std::ostringstream oss;
  oss << FormatTimestamp(r.sent) << ", " << FormatTimestamp(r.received)
      << ", ";
  AppendSeconds(&oss, r.one_way_s);
  return oss.str();
}

}  // namespace udpoffset
