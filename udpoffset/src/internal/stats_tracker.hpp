// Copyright (c) 2025
/**
 * @file stats_tracker.hpp
 * @brief Lock-free counters shared by the send and receive loops.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

#include "udpoffset/stats.hpp"

namespace udpoffset {
namespace internal {

class StatsTracker {
 public:
  void Reset() {
    packets_received_.store(0, std::memory_order_relaxed);
    packets_sent_.store(0, std::memory_order_relaxed);
    malformed_packets_.store(0, std::memory_order_relaxed);
    recv_errors_.store(0, std::memory_order_relaxed);
    send_errors_.store(0, std::memory_order_relaxed);
    samples_.store(0, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    last_error_code_ = ErrorCode::kNone;
    last_error_.clear();
  }

  void IncPacketsReceived() {
    packets_received_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncPacketsSent() {
    packets_sent_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncMalformedPackets() {
    malformed_packets_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncRecvErrors() { recv_errors_.fetch_add(1, std::memory_order_relaxed); }
  void IncSendErrors() { send_errors_.fetch_add(1, std::memory_order_relaxed); }
  void IncSamples() { samples_.fetch_add(1, std::memory_order_relaxed); }

  void SetLastError(ErrorCode code, const std::string& text) {
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    last_error_code_ = code;
    last_error_ = text;
  }

  Stats Snapshot() const {
    Stats stats;
    stats.packets_received = packets_received_.load(std::memory_order_relaxed);
    stats.packets_sent = packets_sent_.load(std::memory_order_relaxed);
    stats.malformed_packets =
        malformed_packets_.load(std::memory_order_relaxed);
    stats.recv_errors = recv_errors_.load(std::memory_order_relaxed);
    stats.send_errors = send_errors_.load(std::memory_order_relaxed);
    stats.samples = samples_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    stats.last_error_code = last_error_code_;
    stats.last_error = last_error_;
    return stats;
  }

 private:
  std::atomic<uint64_t> packets_received_{0};
  std::atomic<uint64_t> packets_sent_{0};
  std::atomic<uint64_t> malformed_packets_{0};
  std::atomic<uint64_t> recv_errors_{0};
  std::atomic<uint64_t> send_errors_{0};
  std::atomic<uint64_t> samples_{0};
  mutable std::mutex last_error_mtx_;
  ErrorCode last_error_code_ = ErrorCode::kNone;
  std::string last_error_;
};

}  // namespace internal
}  // namespace udpoffset
