// Copyright (c) 2025
/**
 * @file socket_posix.cc
 * @brief POSIX (Linux/macOS) implementation of ISocket interface
 */
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "platform/common/socket_utils.hpp"
#include "udpoffset/platform/socket_interface.hpp"

namespace udpoffset {
namespace platform {

class SocketPosix : public ISocket {
 public:
  SocketPosix() : sock_(-1) {}

  ~SocketPosix() override { Close(); }

  bool Initialize() override {
    sock_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock_ < 0) {
      CaptureErrno("socket creation failed");
      return false;
    }

    return true;
  }

  bool Bind(uint16_t port) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      CaptureErrno("bind failed");
      return false;
    }

    return true;
  }

  bool Connect(const Endpoint& peer) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    sockaddr_in addr{};
    if (!EndpointToSockaddr(peer, &addr)) {
      SetError("Invalid IP address: " + peer.address);
      return false;
    }

    if (connect(sock_, reinterpret_cast<const sockaddr*>(&addr),
                sizeof(addr)) < 0) {
      CaptureErrno("connect failed");
      return false;
    }

    return true;
  }

  uint16_t LocalPort() const override {
    if (sock_ < 0) return 0;

    sockaddr_in addr{};
    socklen_t addrlen = sizeof(addr);
    if (getsockname(sock_, reinterpret_cast<sockaddr*>(&addr), &addrlen) < 0) {
      return 0;
    }
    return ntohs(addr.sin_port);
  }

  bool WaitReadable(int64_t timeout_us) override {
    poll_failed_.store(false, std::memory_order_relaxed);
    if (sock_ < 0) {
      SetError("Socket not initialized");
      poll_failed_.store(true, std::memory_order_relaxed);
      return false;
    }

    pollfd pfd{};
    pfd.fd = sock_;
    pfd.events = POLLIN;

    // Convert microseconds to milliseconds
    int timeout_ms = static_cast<int>(timeout_us / 1000);

    int ready = poll(&pfd, 1, timeout_ms);

    if (ready < 0) {
      if (errno == EINTR) return false;  // treat as timeout
      CaptureErrno("poll failed");
      poll_failed_.store(true, std::memory_order_relaxed);
      return false;
    }

    // POLLERR carries a pending ICMP error; let Receive() surface it.
    return ready > 0 && (pfd.revents & (POLLIN | POLLERR)) != 0;
  }

  bool HasPendingError() const override {
    return poll_failed_.load(std::memory_order_relaxed);
  }

  bool Receive(Endpoint* from, std::vector<uint8_t>* data,
               size_t max_size) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    data->resize(max_size);
    sockaddr_in addr{};
    socklen_t addrlen = sizeof(addr);

    ssize_t n = recvfrom(sock_, data->data(), max_size, 0,
                         reinterpret_cast<sockaddr*>(&addr), &addrlen);

    if (n < 0) {
      data->clear();
      CaptureErrno("recvfrom failed");
      return false;
    }

    // Zero-length datagrams are valid for UDP.
    data->resize(static_cast<size_t>(n));
    *from = SockaddrToEndpoint(addr);

    return true;
  }

  bool Send(const Endpoint& to, const std::vector<uint8_t>& data) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    sockaddr_in addr{};
    if (!EndpointToSockaddr(to, &addr)) {
      SetError("Invalid IP address: " + to.address);
      return false;
    }

    ssize_t sent =
        sendto(sock_, data.data(), data.size(), 0,
               reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    return CheckSent(sent, data.size(), "sendto failed");
  }

  bool Send(const std::vector<uint8_t>& data) override {
    if (sock_ < 0) {
      SetError("Socket not initialized");
      return false;
    }

    ssize_t sent = send(sock_, data.data(), data.size(), 0);
    return CheckSent(sent, data.size(), "send failed");
  }

  void Close() override {
    if (sock_ >= 0) {
      close(sock_);
      sock_ = -1;
    }
  }

  std::string GetLastError() const override {
    std::lock_guard<std::mutex> lk(error_mtx_);
    return last_error_;
  }

  bool IsValid() const override { return sock_ >= 0; }

 private:
  bool CheckSent(ssize_t sent, size_t expected, const std::string& context) {
    if (sent < 0) {
      CaptureErrno(context);
      return false;
    }

    if (sent != static_cast<ssize_t>(expected)) {
      std::ostringstream oss;
      oss << "Partial send: sent " << sent << " of " << expected << " bytes";
      SetError(oss.str());
      return false;
    }

    return true;
  }

  void CaptureErrno(const std::string& context) {
    int err = errno;
    std::ostringstream oss;
    oss << context << " (errno " << err << ": " << std::strerror(err) << ")";
    SetError(oss.str());
  }

  void SetError(const std::string& text) {
    std::lock_guard<std::mutex> lk(error_mtx_);
    last_error_ = text;
  }

  int sock_;
  std::atomic<bool> poll_failed_{false};
  mutable std::mutex error_mtx_;  // send and receive threads both report
  std::string last_error_;
};

std::unique_ptr<ISocket> CreatePlatformSocket() {
  return std::unique_ptr<ISocket>(new SocketPosix());
}

}  // namespace platform
}  // namespace udpoffset
