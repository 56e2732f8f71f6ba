// Copyright (c) 2025
#include <utility>

#include "udpoffset/reflector.hpp"

namespace udpoffset {

ReflectorOptions::Builder::Builder() { verbose_ = false; }

ReflectorOptions::Builder& ReflectorOptions::Builder::LogSink(LogCallback cb) {
  log_sink_ = std::move(cb);
  return *this;
}

ReflectorOptions::Builder& ReflectorOptions::Builder::ArrivalSink(
    ArrivalCallback cb) {
  arrival_sink_ = std::move(cb);
  return *this;
}

ReflectorOptions::Builder& ReflectorOptions::Builder::Verbose(bool v) {
  verbose_ = v;
  return *this;
}

ReflectorOptions ReflectorOptions::Builder::Build() const {
  return ReflectorOptions(log_sink_, arrival_sink_, verbose_);
}

ReflectorOptions::ReflectorOptions() { verbose_ = false; }

ReflectorOptions::ReflectorOptions(LogCallback log_cb,
                                   ArrivalCallback arrival_cb, bool verbose)
    : log_callback_(std::move(log_cb)),
      arrival_callback_(std::move(arrival_cb)),
      verbose_(verbose) {}

const ReflectorOptions::LogCallback& ReflectorOptions::LogSink() const {
  return log_callback_;
}

const ReflectorOptions::ArrivalCallback& ReflectorOptions::ArrivalSink()
    const {
  return arrival_callback_;
}

bool ReflectorOptions::Verbose() const { return verbose_; }

}  // namespace udpoffset
