// Copyright (c) 2025
/**
 * @file reflector.hpp
 * @brief Timestamp reflector (UDP/IPv4).
 *
 * Turns every 16-byte request into a 32-byte reply: the request bytes
 * verbatim followed by the reflector's realtime capture.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "udpoffset/export.hpp"
#include "udpoffset/offset_sample.hpp"
#include "udpoffset/stats.hpp"
#include "udpoffset/time_source.hpp"
#include "udpoffset/wire_format.hpp"

namespace udpoffset {

/**
 * Immutable configuration options for Reflector.
 */
class ReflectorOptions {
 public:
  using LogCallback = std::function<void(const std::string&)>;
  using ArrivalCallback = std::function<void(const ArrivalRecord&)>;

  class Builder {
   public:
    Builder();
    /** Diagnostics sink (banners, malformed packets, errors). */
    Builder& LogSink(LogCallback cb);
    /** Receives a one-way record for every valid request (optional). */
    Builder& ArrivalSink(ArrivalCallback cb);
    /** Log every reflected datagram (default: false). */
    Builder& Verbose(bool v);
    ReflectorOptions Build() const;

   private:
    LogCallback log_sink_;
    ArrivalCallback arrival_sink_;
    bool verbose_;
  };

  ReflectorOptions();

  const LogCallback& LogSink() const;
  const ArrivalCallback& ArrivalSink() const;
  bool Verbose() const;

 private:
  ReflectorOptions(LogCallback log_cb, ArrivalCallback arrival_cb,
                   bool verbose);

  LogCallback log_callback_;
  ArrivalCallback arrival_callback_;
  bool verbose_;
};

/**
 * @brief Echoes timestamp requests back with a reflector capture appended.
 *
 * A background thread serves the socket until Stop() or until a fatal
 * socket or clock error. Datagrams of the wrong length are logged and
 * dropped without a reply.
 */
class UDP_OFFSET_API Reflector {
 public:
  Reflector();
  ~Reflector();

  Reflector(const Reflector&) = delete;
  Reflector& operator=(const Reflector&) = delete;

  /**
   * @brief Binds 0.0.0.0:port and starts serving.
   * @param port UDP port to bind (0 = ephemeral, see LocalPort()).
   * @param time_source Clock for captures (default: RealtimeClock).
   * @param options Immutable configuration snapshot.
   * @return true on success; false if the socket could not be bound.
   */
  bool Start(uint16_t port = kDefaultPort, TimeSource* time_source = nullptr,
             const ReflectorOptions& options = ReflectorOptions());

  /** Stops serving and joins the worker. Safe to call multiple times. */
  void Stop();

  /**
   * @brief Blocks until the worker ends.
   * @return true if ended by Stop(); false on a fatal error (see GetStats())
   *         or if never started.
   */
  bool Wait();

  /** Bound UDP port while running, 0 otherwise. */
  uint16_t LocalPort() const;

  /** Returns latest statistics snapshot (thread-safe). */
  Stats GetStats() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace udpoffset
