// Copyright (c) 2025
/**
 * @file reflector.cc
 * @brief Timestamp reflector implementation (UDP/IPv4).
 */
#include "udpoffset/reflector.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "internal/exit_signal.hpp"
#include "internal/stats_tracker.hpp"
#include "udpoffset/platform/socket_interface.hpp"
#include "udpoffset/realtime_clock.hpp"

namespace udpoffset {

namespace {
// Readiness poll period; bounds how long Stop() waits for the worker.
constexpr int64_t kPollTimeoutUs = 200000;
}  // namespace

class Reflector::Impl {
 public:
  Impl() = default;
  ~Impl() { Stop(); }

  bool Start(uint16_t port, TimeSource* time_source,
             const ReflectorOptions& options) {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    if (running_.load()) return true;
    ReleaseWorker();  // after a fatal error the worker has exited

    time_source_ = time_source ? time_source : &RealtimeClock::Instance();
    log_callback_ = options.LogSink();
    arrival_callback_ = options.ArrivalSink();
    verbose_ = options.Verbose();
    exit_.Reset();
    stats_.Reset();

    if (!CreateAndBindSocket(port)) {
      return false;
    }

    {
      std::ostringstream oss;
      oss << "Listening for timestamps on port " << socket_->LocalPort()
          << "...";
      Log(oss.str());
    }

    started_.store(true);
    running_.store(true);
    thread_ = std::thread([this]() { Loop(); });
    return true;
  }

  void Stop() {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    running_.store(false);
    exit_.Raise(false);
    ReleaseWorker();
  }

  bool Wait() {
    if (!started_.load()) return false;
    return exit_.Wait();
  }

  uint16_t LocalPort() const {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    return socket_ ? socket_->LocalPort() : 0;
  }

  Stats GetStats() const { return stats_.Snapshot(); }

 private:
  /** Joins the worker thread and closes the socket. */
  void ReleaseWorker() {
    if (thread_.joinable()) {
      thread_.join();
    }
    if (socket_) {
      socket_->Close();
      socket_.reset();
    }
  }

  /** Creates UDP socket and binds to 0.0.0.0:port. */
  bool CreateAndBindSocket(uint16_t port) {
    socket_ = platform::CreatePlatformSocket();
    if (!socket_->Initialize()) {
      RecordError(ErrorCode::kSocketBindFailed,
                  "Socket initialization failed: " + socket_->GetLastError());
      socket_.reset();
      return false;
    }

    if (!socket_->Bind(port)) {
      RecordError(ErrorCode::kSocketBindFailed,
                  "Socket bind failed: " + socket_->GetLastError());
      socket_->Close();
      socket_.reset();
      return false;
    }
    return true;
  }

  /** Main loop: wait for datagrams and reflect them. */
  void Loop() {
    while (running_.load()) {
      if (!socket_->WaitReadable(kPollTimeoutUs)) {
        if (socket_->HasPendingError()) {
          stats_.IncRecvErrors();
          Fail(ErrorCode::kReceiveFailed,
               "Wait failed: " + socket_->GetLastError());
          return;
        }
        continue;
      }
      if (!HandleSingleDatagram()) return;
    }
  }

  /**
   * @brief Receives one datagram and replies to its sender.
   * @return false after a fatal error (already recorded).
   */
  bool HandleSingleDatagram() {
    platform::Endpoint from;
    std::vector<uint8_t> request;
    if (!socket_->Receive(&from, &request, kMaxDatagramSize)) {
      stats_.IncRecvErrors();
      Fail(ErrorCode::kReceiveFailed,
           "Receive failed: " + socket_->GetLastError());
      return false;
    }

    if (request.size() != kRequestSize) {
      stats_.IncMalformedPackets();
      std::ostringstream oss;
      oss << "Invalid packet from " << from.address << ":" << from.port
          << ": payload size " << request.size() << " != " << kRequestSize;
      RecordError(ErrorCode::kMalformedPacket, oss.str());
      return true;
    }
    stats_.IncPacketsReceived();

    TimeSpec tau2;
    if (!time_source_->NowUnix(&tau2)) {
      Fail(ErrorCode::kClockUnavailable,
           "Clock read failed: " + time_source_->GetLastError());
      return false;
    }

    std::vector<uint8_t> reply;
    if (!BuildReply(request, tau2, &reply)) {
      Fail(ErrorCode::kDecodeError, "Reply encoding rejected a request");
      return false;
    }

    if (!socket_->Send(from, reply)) {
      stats_.IncSendErrors();
      Fail(ErrorCode::kSendFailed, "Send failed: " + socket_->GetLastError());
      return false;
    }
    stats_.IncPacketsSent();

    if (verbose_) {
      std::ostringstream oss;
      oss << "[Reflector] reflected to " << from.address << ":" << from.port
          << " tau2=" << FormatTimestamp(tau2);
      Log(oss.str());
    }

    if (arrival_callback_) {
      TimeSpec sent;
      if (!DecodeTimestamp(request.data(), request.size(), &sent)) {
        Fail(ErrorCode::kDecodeError, "Request decoding failed");
        return false;
      }
      arrival_callback_(ComputeArrivalRecord(sent, tau2));
      stats_.IncSamples();
    }
    return true;
  }

  /** Records a fatal error and ends the session. */
  void Fail(ErrorCode code, const std::string& msg) {
    RecordError(code, msg);
    running_.store(false);
    exit_.Raise(true);
  }

  void RecordError(ErrorCode code, const std::string& msg) {
    std::ostringstream oss;
    oss << "[Reflector] " << ErrorCodeName(code) << ": " << msg;
    Log(oss.str());
    if (IsFatal(code)) stats_.SetLastError(code, msg);
  }

  void Log(const std::string& text) {
    if (log_callback_) log_callback_(text);
  }

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> started_{false};
  std::unique_ptr<platform::ISocket> socket_;
  mutable std::mutex start_stop_mtx_;

  TimeSource* time_source_{nullptr};
  ReflectorOptions::LogCallback log_callback_;
  ReflectorOptions::ArrivalCallback arrival_callback_;
  bool verbose_{false};
  internal::StatsTracker stats_;
  internal::ExitSignal exit_;
};

Reflector::Reflector() : impl_(new Impl) {}
Reflector::~Reflector() = default;

bool Reflector::Start(uint16_t port, TimeSource* time_source,
                      const ReflectorOptions& options) {
  return impl_->Start(port, time_source, options);
}
void Reflector::Stop() { impl_->Stop(); }
bool Reflector::Wait() { return impl_->Wait(); }
uint16_t Reflector::LocalPort() const { return impl_->LocalPort(); }
Stats Reflector::GetStats() const { return impl_->GetStats(); }

}  // namespace udpoffset
