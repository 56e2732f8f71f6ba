// Copyright (c) 2025
#include <ostream>
#include <utility>

#include "udpoffset/offset_meter.hpp"

namespace udpoffset {

MeterOptions::Builder::Builder()
    : interval_s_(MeterOptions::kDefaultIntervalSeconds),
      measure_(true),
      verbose_(false) {}

MeterOptions::Builder::Builder(const MeterOptions& base)
    : interval_s_(base.interval_s_),
      measure_(base.measure_),
      sample_sink_(base.sample_callback_),
      log_sink_(base.log_callback_),
      verbose_(base.verbose_) {}

MeterOptions::Builder& MeterOptions::Builder::IntervalSeconds(double v) {
  interval_s_ = v;
  return *this;
}

MeterOptions::Builder& MeterOptions::Builder::Measure(bool v) {
  measure_ = v;
  return *this;
}

MeterOptions::Builder& MeterOptions::Builder::SampleSink(SampleCallback cb) {
  sample_sink_ = std::move(cb);
  return *this;
}

MeterOptions::Builder& MeterOptions::Builder::LogSink(LogCallback cb) {
  log_sink_ = std::move(cb);
  return *this;
}

MeterOptions::Builder& MeterOptions::Builder::Verbose(bool v) {
  verbose_ = v;
  return *this;
}

MeterOptions MeterOptions::Builder::Build() const {
  return MeterOptions(interval_s_, measure_, sample_sink_, log_sink_,
                      verbose_);
}

MeterOptions::MeterOptions()
    : interval_s_(kDefaultIntervalSeconds), measure_(true), verbose_(false) {}

MeterOptions::MeterOptions(double interval_s, bool measure,
                           SampleCallback sample_cb, LogCallback log_cb,
                           bool verbose)
    : interval_s_(interval_s),
      measure_(measure),
      sample_callback_(std::move(sample_cb)),
      log_callback_(std::move(log_cb)),
      verbose_(verbose) {}

std::ostream& operator<<(std::ostream& os, const MeterOptions& o) {
  os << "interval=" << o.interval_s_ << "s"
     << " measure=" << (o.measure_ ? "on" : "off")
     << " verbose=" << (o.verbose_ ? "on" : "off");
  return os;
}

}  // namespace udpoffset
