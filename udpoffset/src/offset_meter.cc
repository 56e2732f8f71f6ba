// Copyright (c) 2025
/**
 * @file offset_meter.cc
 * @brief Emitter and estimator loops over one connected UDP socket.
 */
#include "udpoffset/offset_meter.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "internal/exit_signal.hpp"
#include "internal/stats_tracker.hpp"
#include "platform/common/socket_utils.hpp"
#include "udpoffset/platform/socket_interface.hpp"
#include "udpoffset/realtime_clock.hpp"
#include "udpoffset/wire_format.hpp"

namespace udpoffset {

namespace {
// Readiness poll period; bounds how long Stop() waits for the receive loop.
constexpr int64_t kPollTimeoutUs = 200000;
}  // namespace

struct OffsetMeter::Impl {
  std::unique_ptr<platform::ISocket> udp_socket;
  TimeSource* time_source = nullptr;
  MeterOptions opts;

  std::atomic<bool> running{false};
  std::atomic<bool> started{false};
  std::thread send_thread;
  std::thread recv_thread;
  mutable std::mutex start_stop_mtx;

  internal::StatsTracker stats;
  internal::ExitSignal exit_signal;

  bool Start(const std::string& ip, uint16_t port, TimeSource* ts,
             const MeterOptions& opt);
  void Stop();
  void ReleaseWorkers();
  bool OpenSocket(const std::string& ip, uint16_t port);

  void SendLoop();
  void ReceiveLoop();
  bool HandleReply();

  void Fail(ErrorCode code, const std::string& msg);
  void RecordError(ErrorCode code, const std::string& msg);
  void Log(const std::string& text) const {
    if (opts.LogSink()) opts.LogSink()(text);
  }
};

bool OffsetMeter::Impl::Start(const std::string& ip, uint16_t port,
                              TimeSource* ts, const MeterOptions& opt) {
  std::lock_guard<std::mutex> lk(start_stop_mtx);
  if (running.load()) return true;
  ReleaseWorkers();  // after a fatal error the workers have exited

  opts = opt;
  time_source = ts ? ts : &RealtimeClock::Instance();
  exit_signal.Reset();
  stats.Reset();

  const double interval_s = opts.IntervalSeconds();
  if (!(interval_s > 0.0) || !std::isfinite(interval_s) ||
      interval_s > MeterOptions::kMaxIntervalSeconds) {
    std::ostringstream oss;
    oss << "interval must be in (0, " << MeterOptions::kMaxIntervalSeconds
        << "] seconds (got " << interval_s << ")";
    RecordError(ErrorCode::kInvalidArgument, oss.str());
    return false;
  }
  if (!platform::IsValidIpv4(ip)) {
    RecordError(ErrorCode::kInvalidArgument, "invalid IPv4 address: " + ip);
    return false;
  }

  if (!OpenSocket(ip, port)) return false;

  {
    std::ostringstream oss;
    oss << "Sending timestamps to " << ip << ":" << port << " every "
        << interval_s << " seconds...";
    Log(oss.str());
  }
  if (opts.Verbose()) {
    std::ostringstream oss;
    oss << "[OffsetMeter] local port " << udp_socket->LocalPort() << " "
        << opts;
    Log(oss.str());
  }

  started.store(true);
  running.store(true);
  send_thread = std::thread([this]() { SendLoop(); });
  if (opts.Measure()) {
    recv_thread = std::thread([this]() { ReceiveLoop(); });
  }
  return true;
}

void OffsetMeter::Impl::Stop() {
  std::lock_guard<std::mutex> lk(start_stop_mtx);
  running.store(false);
  exit_signal.Raise(false);
  ReleaseWorkers();
}

void OffsetMeter::Impl::ReleaseWorkers() {
  if (send_thread.joinable()) send_thread.join();
  if (recv_thread.joinable()) recv_thread.join();
  if (udp_socket) {
    udp_socket->Close();
    udp_socket.reset();
  }
}

bool OffsetMeter::Impl::OpenSocket(const std::string& ip, uint16_t port) {
  udp_socket = platform::CreatePlatformSocket();
  if (!udp_socket->Initialize()) {
    RecordError(ErrorCode::kSocketBindFailed,
                "Socket initialization failed: " +
                    udp_socket->GetLastError());
    udp_socket.reset();
    return false;
  }

  // Bind to any local address/ephemeral port (port 0 = OS chooses)
  if (!udp_socket->Bind(0)) {
    RecordError(ErrorCode::kSocketBindFailed,
                "Socket bind failed: " + udp_socket->GetLastError());
    udp_socket->Close();
    udp_socket.reset();
    return false;
  }

  if (!udp_socket->Connect(platform::Endpoint(ip, port))) {
    RecordError(ErrorCode::kSocketConnectFailed,
                "Socket connect failed: " + udp_socket->GetLastError());
    udp_socket->Close();
    udp_socket.reset();
    return false;
  }
  return true;
}

void OffsetMeter::Impl::SendLoop() {
  const auto interval = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(opts.IntervalSeconds()));

  while (running.load()) {
    TimeSpec t1;
    if (!time_source->NowUnix(&t1)) {
      Fail(ErrorCode::kClockUnavailable,
           "Clock read failed: " + time_source->GetLastError());
      return;
    }

    if (!udp_socket->Send(EncodeRequest(t1))) {
      stats.IncSendErrors();
      Fail(ErrorCode::kSendFailed,
           "Send failed: " + udp_socket->GetLastError());
      return;
    }
    stats.IncPacketsSent();

    if (opts.Verbose()) {
      Log("[OffsetMeter] sent t1=" + FormatTimestamp(t1));
    }

    // Sleeps the full interval unless Stop() or the receive loop ends the
    // session.
    if (exit_signal.WaitFor(interval)) return;
  }
}

void OffsetMeter::Impl::ReceiveLoop() {
  while (running.load()) {
    if (!udp_socket->WaitReadable(kPollTimeoutUs)) {
      if (udp_socket->HasPendingError()) {
        stats.IncRecvErrors();
        Fail(ErrorCode::kReceiveFailed,
             "Wait failed: " + udp_socket->GetLastError());
        return;
      }
      continue;
    }
    if (!HandleReply()) return;
  }
}

/**
 * @brief Receives one reply and emits its sample.
 * @return false after a fatal error (already recorded).
 */
bool OffsetMeter::Impl::HandleReply() {
  platform::Endpoint from;
  std::vector<uint8_t> reply;
  if (!udp_socket->Receive(&from, &reply, kMaxDatagramSize)) {
    stats.IncRecvErrors();
    Fail(ErrorCode::kReceiveFailed,
         "Receive failed: " + udp_socket->GetLastError());
    return false;
  }

  if (reply.size() != kReplySize) {
    stats.IncMalformedPackets();
    std::ostringstream oss;
    oss << "Invalid packet: payload size " << reply.size()
        << " != " << kReplySize;
    RecordError(ErrorCode::kMalformedPacket, oss.str());
    return true;
  }

  // Arrival stamp first: everything below adds latency to t3.
  TimeSpec t3;
  if (!time_source->NowUnix(&t3)) {
    Fail(ErrorCode::kClockUnavailable,
         "Clock read failed: " + time_source->GetLastError());
    return false;
  }

  TimeSpec t1;
  TimeSpec tau2;
  if (!ParseReply(reply, &t1, &tau2)) {
    Fail(ErrorCode::kDecodeError, "Reply decoding failed");
    return false;
  }
  stats.IncPacketsReceived();

  const OffsetSample sample = ComputeOffsetSample(t1, tau2, t3);
  if (opts.SampleSink()) opts.SampleSink()(sample);
  stats.IncSamples();
  return true;
}

void OffsetMeter::Impl::Fail(ErrorCode code, const std::string& msg) {
  RecordError(code, msg);
  running.store(false);
  exit_signal.Raise(true);
}

void OffsetMeter::Impl::RecordError(ErrorCode code, const std::string& msg) {
  std::ostringstream oss;
  oss << "[OffsetMeter] " << ErrorCodeName(code) << ": " << msg;
  Log(oss.str());
  // Dropped packets are counted, not reported as the session's error.
  if (IsFatal(code)) stats.SetLastError(code, msg);
}

OffsetMeter::OffsetMeter() : p_(new Impl) {}
OffsetMeter::~OffsetMeter() { p_->Stop(); }

bool OffsetMeter::Start(const std::string& ip, uint16_t port,
                        TimeSource* time_source, const MeterOptions& opt) {
  return p_->Start(ip, port, time_source, opt);
}

void OffsetMeter::Stop() { p_->Stop(); }

bool OffsetMeter::Wait() {
  if (!p_->started.load()) return false;
  return p_->exit_signal.Wait();
}

uint16_t OffsetMeter::LocalPort() const {
  std::lock_guard<std::mutex> lk(p_->start_stop_mtx);
  return p_->udp_socket ? p_->udp_socket->LocalPort() : 0;
}

Stats OffsetMeter::GetStats() const { return p_->stats.Snapshot(); }

}  // namespace udpoffset
