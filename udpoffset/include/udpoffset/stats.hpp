// Copyright (c) 2025
/**
 * @file stats.hpp
 * @brief Error taxonomy and per-component statistics snapshot.
 */
#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace udpoffset {

/**
 * @brief Failure classes reported by the reflector and the offset meter.
 *
 * kMalformedPacket is the only recoverable code; every other code ends the
 * loop that hit it.
 */
enum class ErrorCode {
  kNone,
  kClockUnavailable,     ///< Realtime clock could not be read
  kSocketBindFailed,     ///< Socket creation or bind failed at start
  kSocketConnectFailed,  ///< connect() to the peer failed at start
  kSendFailed,           ///< send()/sendto() failed or sent partially
  kReceiveFailed,        ///< poll()/recv() failed
  kMalformedPacket,      ///< Datagram of unexpected length (dropped)
  kDecodeError,          ///< Codec rejected a length-checked buffer
  kInvalidArgument,      ///< Bad configuration passed to Start()
};

/** Returns a stable name such as "SendFailed". */
const char* ErrorCodeName(ErrorCode code);

/** Returns true if the code terminates the loop that reported it. */
bool IsFatal(ErrorCode code);

std::ostream& operator<<(std::ostream& os, ErrorCode code);

struct Stats {
  uint64_t packets_received = 0;   ///< Datagrams of the expected length
  uint64_t packets_sent = 0;       ///< Datagrams sent successfully
  uint64_t malformed_packets = 0;  ///< Datagrams dropped for wrong length
  uint64_t recv_errors = 0;        ///< poll()/recv() failures
  uint64_t send_errors = 0;        ///< send()/sendto() failures
  uint64_t samples = 0;            ///< Records handed to the output sink
  ErrorCode last_error_code = ErrorCode::kNone;  ///< Latest fatal error
  std::string last_error;  ///< Latest error message (with errno text)

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const Stats& s);
};

}  // namespace udpoffset
