// Copyright (c) 2025
/**
 * @file socket_interface.hpp
 * @brief Platform-independent UDP socket interface.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace udpoffset {
namespace platform {

/** IPv4 endpoint (numeric dotted-quad address and port). */
struct Endpoint {
  std::string address;  ///< e.g. "192.168.1.1"
  uint16_t port;

  Endpoint() : port(0) {}
  Endpoint(const std::string& addr, uint16_t p) : address(addr), port(p) {}
};

/**
 * @brief UDP/IPv4 datagram socket.
 *
 * Send and Receive may be called concurrently from two threads on the same
 * socket; the datagram socket handles the two directions independently.
 * Other methods are not thread-safe.
 */
class ISocket {
 public:
  virtual ~ISocket() = default;

  /** Creates the underlying socket. */
  virtual bool Initialize() = 0;

  /** Binds to INADDR_ANY:port (0 = ephemeral port). */
  virtual bool Bind(uint16_t port) = 0;

  /**
   * @brief Fixes the default destination and restricts receive to that peer.
   * @param peer Numeric IPv4 address and port.
   */
  virtual bool Connect(const Endpoint& peer) = 0;

  /** Returns the bound local port, or 0 if unbound or on error. */
  virtual uint16_t LocalPort() const = 0;

  /**
   * @brief Waits until a datagram is readable.
   * @param timeout_us Timeout in microseconds.
   * @return true if readable; false on timeout or error. On error,
   *         GetLastError() is non-empty and HasPendingError() is true.
   */
  virtual bool WaitReadable(int64_t timeout_us) = 0;

  /** True if the last WaitReadable() call failed (as opposed to timing out). */
  virtual bool HasPendingError() const = 0;

  /**
   * @brief Receives one datagram.
   * @param from Sender endpoint (output).
   * @param data Datagram bytes (output, resized to the received length; a
   *             zero-length datagram yields an empty vector).
   * @param max_size Receive buffer size in bytes.
   */
  virtual bool Receive(Endpoint* from, std::vector<uint8_t>* data,
                       size_t max_size) = 0;

  /** Sends one datagram to an explicit destination. */
  virtual bool Send(const Endpoint& to, const std::vector<uint8_t>& data) = 0;

  /** Sends one datagram to the connected peer. */
  virtual bool Send(const std::vector<uint8_t>& data) = 0;

  virtual void Close() = 0;

  /** Returns a description of the most recent error. */
  virtual std::string GetLastError() const = 0;

  virtual bool IsValid() const = 0;
};

/** Creates the socket implementation for the current platform. */
std::unique_ptr<ISocket> CreatePlatformSocket();

}  // namespace platform
}  // namespace udpoffset
