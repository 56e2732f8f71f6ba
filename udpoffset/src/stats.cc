// Copyright (c) 2025
#include "udpoffset/stats.hpp"

#include <ostream>

namespace udpoffset {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "None";
    case ErrorCode::kClockUnavailable:
      return "ClockUnavailable";
    case ErrorCode::kSocketBindFailed:
      return "SocketBindFailed";
    case ErrorCode::kSocketConnectFailed:
      return "SocketConnectFailed";
    case ErrorCode::kSendFailed:
      return "SendFailed";
    case ErrorCode::kReceiveFailed:
      return "ReceiveFailed";
    case ErrorCode::kMalformedPacket:
      return "MalformedPacket";
    case ErrorCode::kDecodeError:
      return "DecodeError";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
  }
  return "Unknown";
}

bool IsFatal(ErrorCode code) {
  return code != ErrorCode::kNone && code != ErrorCode::kMalformedPacket;
}

std::ostream& operator<<(std::ostream& os, ErrorCode code) {
  return os << ErrorCodeName(code);
}

std::ostream& operator<<(std::ostream& os, const Stats& s) {
  os << "received=" << s.packets_received << " sent=" << s.packets_sent
     << " malformed=" << s.malformed_packets << " recv_errors=" << s.recv_errors
     << " send_errors=" << s.send_errors << " samples=" << s.samples;
  if (s.last_error_code != ErrorCode::kNone) {
    os << " last_error=" << s.last_error_code << " (" << s.last_error << ")";
  }
  return os;
}

}  // namespace udpoffset
