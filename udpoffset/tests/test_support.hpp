// Copyright (c) 2025
/**
 * @file test_support.hpp
 * @brief Loopback UDP peer and deterministic clocks for tests.
 */
#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "udpoffset/time_source.hpp"

namespace udpoffset {
namespace testutil {

/**
 * @brief Raw UDP socket bound to 127.0.0.1 on an ephemeral port.
 *
 * Plays the remote side in tests: a client of the reflector, or a stand-in
 * reflector for the offset meter.
 */
class LoopbackPeer {
 public:
  LoopbackPeer() {
    sock_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock_ < 0) return;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      close(sock_);
      sock_ = -1;
    }
  }
  ~LoopbackPeer() {
    if (sock_ >= 0) close(sock_);
  }

  LoopbackPeer(const LoopbackPeer&) = delete;
  LoopbackPeer& operator=(const LoopbackPeer&) = delete;

  bool IsValid() const { return sock_ >= 0; }

  uint16_t Port() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(sock_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
      return 0;
    }
    return ntohs(addr.sin_port);
  }

  /** Sends bytes to 127.0.0.1:port. */
  bool SendTo(uint16_t port, const std::vector<uint8_t>& data) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);
    ssize_t n = sendto(sock_, data.data(), data.size(), 0,
                       reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    return n == static_cast<ssize_t>(data.size());
  }

  /** Replies to the sender of the last datagram received. */
  bool Reply(const std::vector<uint8_t>& data) {
    ssize_t n = sendto(sock_, data.data(), data.size(), 0,
                       reinterpret_cast<sockaddr*>(&last_from_),
                       sizeof(last_from_));
    return n == static_cast<ssize_t>(data.size());
  }

  /**
   * @brief Receives one datagram, waiting at most timeout_ms.
   * @return false on timeout or error.
   */
  bool Receive(int timeout_ms, std::vector<uint8_t>* data) {
    pollfd pfd{};
    pfd.fd = sock_;
    pfd.events = POLLIN;
    if (poll(&pfd, 1, timeout_ms) <= 0) return false;

    data->resize(1500);
    socklen_t len = sizeof(last_from_);
    ssize_t n = recvfrom(sock_, data->data(), data->size(), 0,
                         reinterpret_cast<sockaddr*>(&last_from_), &len);
    if (n < 0) return false;
    data->resize(static_cast<size_t>(n));
    return true;
  }

 private:
  int sock_ = -1;
  sockaddr_in last_from_{};
};

/**
 * @brief Clock that returns a scripted sequence of readings.
 *
 * Each call consumes the next reading; the last one repeats forever.
 */
class ScriptedClock : public TimeSource {
 public:
  explicit ScriptedClock(std::vector<TimeSpec> readings)
      : readings_(readings.begin(), readings.end()) {}

  bool NowUnix(TimeSpec* out) override {
    std::lock_guard<std::mutex> lk(mtx_);
    if (readings_.empty()) return false;
    *out = readings_.front();
    if (readings_.size() > 1) readings_.pop_front();
    ++calls_;
    return true;
  }

  int Calls() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return calls_;
  }

 private:
  mutable std::mutex mtx_;
  std::deque<TimeSpec> readings_;
  int calls_ = 0;
};

/** Clock whose source is always unavailable. */
class BrokenClock : public TimeSource {
 public:
  bool NowUnix(TimeSpec* /*out*/) override { return false; }
  std::string GetLastError() const override { return "no clock in test"; }
};

}  // namespace testutil
}  // namespace udpoffset
