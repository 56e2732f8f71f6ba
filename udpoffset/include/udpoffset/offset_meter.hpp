// Copyright (c) 2025
/**
 * @file offset_meter.hpp
 * @brief Periodic timestamp emitter with reply-driven offset estimation.
 *
 * One connected UDP socket is shared by two threads:
 * - the emitter sends the local realtime clock every interval;
 * - the estimator turns each 32-byte reply into an OffsetSample.
 *
 * Replies are not correlated with requests: each reply carries its own t1,
 * so a late reply still yields a self-consistent sample.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>

#include "udpoffset/export.hpp"
#include "udpoffset/offset_sample.hpp"
#include "udpoffset/stats.hpp"
#include "udpoffset/time_source.hpp"

namespace udpoffset {

/**
 * @brief Immutable options for OffsetMeter.
 *
 * Use the Builder to construct instances.
 */
class MeterOptions {
 public:
  using LogCallback = std::function<void(const std::string&)>;
  using SampleCallback = std::function<void(const OffsetSample&)>;

  static constexpr double kDefaultIntervalSeconds = 1.0;
  /** Upper bound on the interval; the sleep must fit in int64 nanoseconds. */
  static constexpr double kMaxIntervalSeconds = 1e9;

  class Builder {
   public:
    Builder();
    explicit Builder(const MeterOptions& base);

    /** Send period in seconds, in (0, kMaxIntervalSeconds] (default: 1.0). */
    Builder& IntervalSeconds(double v);
    /** Run the estimator on replies (default: true). */
    Builder& Measure(bool v);
    /** Receives every computed sample, from the receive thread. */
    Builder& SampleSink(SampleCallback cb);
    /** Diagnostics sink (banners, malformed packets, errors). */
    Builder& LogSink(LogCallback cb);
    /** Log every sent datagram (default: false). */
    Builder& Verbose(bool v);

    MeterOptions Build() const;

   private:
    double interval_s_;
    bool measure_;
    SampleCallback sample_sink_;
    LogCallback log_sink_;
    bool verbose_;
  };

  MeterOptions();

  /** @name Getters (immutable) */
  ///@{
  double IntervalSeconds() const { return interval_s_; }
  bool Measure() const { return measure_; }
  const SampleCallback& SampleSink() const { return sample_callback_; }
  const LogCallback& LogSink() const { return log_callback_; }
  bool Verbose() const { return verbose_; }
  ///@}

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const MeterOptions& o);

 private:
  MeterOptions(double interval_s, bool measure, SampleCallback sample_cb,
               LogCallback log_cb, bool verbose);

  double interval_s_;
  bool measure_;
  SampleCallback sample_callback_;
  LogCallback log_callback_;
  bool verbose_;
};

/**
 * @brief Emitter and estimator sharing one connected UDP socket.
 *
 * Start() spawns the send thread and, in measure mode, the receive thread.
 * A fatal error in either ends both; Wait() reports it.
 */
class UDP_OFFSET_API OffsetMeter {
 public:
  OffsetMeter();
  ~OffsetMeter();

  OffsetMeter(const OffsetMeter&) = delete;
  OffsetMeter& operator=(const OffsetMeter&) = delete;

  /**
   * @brief Connects to the reflector and starts the loops.
   * @param ip  IPv4 address in numeric form (no DNS).
   * @param port UDP port of the reflector.
   * @param time_source Clock for captures (default: RealtimeClock).
   * @param opt Immutable options snapshot.
   * @return true if the loops started; false on invalid options or if the
   *         socket could not be bound or connected (see GetStats()).
   */
  bool Start(const std::string& ip, uint16_t port,
             TimeSource* time_source = nullptr,
             const MeterOptions& opt = MeterOptions());

  /** Stops both loops and joins them. Safe to call multiple times. */
  void Stop();

  /**
   * @brief Blocks until the session ends.
   * @return true if ended by Stop(); false on a fatal error (see GetStats())
   *         or if never started.
   */
  bool Wait();

  /** Ephemeral local port while running, 0 otherwise. */
  uint16_t LocalPort() const;

  Stats GetStats() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

}  // namespace udpoffset
