// Copyright (c) 2025
/**
 * @file wire_format.cc
 * @brief Implementation of the timestamp datagram codec.
 */
#include "udpoffset/wire_format.hpp"

#include <array>
#include <utility>
#include <vector>

namespace udpoffset {

EncodedTimestamp EncodeTimestamp(const TimeSpec& ts) {
  EncodedTimestamp out{};
  size_t at = 0U;

  auto put_le64i = [&](int64_t v) {
    uint64_t u = static_cast<uint64_t>(v);
    for (int i = 0; i < 8; ++i) {
      out[at++] = static_cast<uint8_t>((u >> (8 * i)) & 0xffU);
    }
  };

  put_le64i(ts.sec);
  put_le64i(ts.nsec);
  return out;
}

bool DecodeTimestamp(const uint8_t* data, size_t size, TimeSpec* out) {
  if (out == nullptr) return false;
  if (data == nullptr || size < kTimestampSize) return false;

  auto rd64i = [&](size_t at) {
    uint64_t u = (static_cast<uint64_t>(data[at])) |
                 (static_cast<uint64_t>(data[at + 1]) << 8) |
                 (static_cast<uint64_t>(data[at + 2]) << 16) |
                 (static_cast<uint64_t>(data[at + 3]) << 24) |
                 (static_cast<uint64_t>(data[at + 4]) << 32) |
                 (static_cast<uint64_t>(data[at + 5]) << 40) |
                 (static_cast<uint64_t>(data[at + 6]) << 48) |
                 (static_cast<uint64_t>(data[at + 7]) << 56);
    return static_cast<int64_t>(u);
  };

  *out = TimeSpec(rd64i(0U), rd64i(8U));
  return true;
}

std::vector<uint8_t> EncodeRequest(const TimeSpec& t1) {
  EncodedTimestamp enc = EncodeTimestamp(t1);
  return std::vector<uint8_t>(enc.begin(), enc.end());
}

bool BuildReply(const std::vector<uint8_t>& request, const TimeSpec& tau2,
                std::vector<uint8_t>* out) {
  if (out == nullptr) return false;
  if (request.size() != kRequestSize) return false;

  EncodedTimestamp enc = EncodeTimestamp(tau2);
  std::vector<uint8_t> reply;
  reply.reserve(kReplySize);
  reply.insert(reply.end(), request.begin(), request.end());
  reply.insert(reply.end(), enc.begin(), enc.end());

  *out = std::move(reply);
  return true;
}

bool ParseReply(const std::vector<uint8_t>& reply, TimeSpec* t1,
                TimeSpec* tau2) {
  if (t1 == nullptr || tau2 == nullptr) return false;
  if (reply.size() != kReplySize) return false;

  TimeSpec a{};
  TimeSpec b{};
  if (!DecodeTimestamp(reply.data(), kTimestampSize, &a)) return false;
  if (!DecodeTimestamp(reply.data() + kTimestampSize,
                       reply.size() - kTimestampSize, &b)) {
    return false;
  }

  *t1 = a;
  *tau2 = b;
  return true;
}

}  // namespace udpoffset
