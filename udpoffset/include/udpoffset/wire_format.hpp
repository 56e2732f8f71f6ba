// Copyright (c) 2025
/**
 * @file wire_format.hpp
 * @brief Timestamp datagram layout and codec.
 *
 * Wire contract (fixed width, little-endian, no framing beyond the datagram
 * length):
 *
 *   Request (16 bytes):
 *   - sec:        8 bytes, int64_t emitter capture seconds
 *   - nsec:       8 bytes, int64_t emitter capture nanoseconds
 *
 *   Reply (32 bytes):
 *   - request:   16 bytes, the request datagram echoed verbatim
 *   - sec:        8 bytes, int64_t reflector capture seconds
 *   - nsec:       8 bytes, int64_t reflector capture nanoseconds
 *
 * The nanosecond field is not range-checked on decode.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "udpoffset/time_spec.hpp"

namespace udpoffset {

/** @brief Encoded size of one timestamp. */
constexpr size_t kTimestampSize = 16;
/** @brief Request datagram size (one timestamp). */
constexpr size_t kRequestSize = kTimestampSize;
/** @brief Reply datagram size (two timestamps). */
constexpr size_t kReplySize = 2 * kTimestampSize;
/** @brief Receive buffer size; larger than any valid datagram. */
constexpr size_t kMaxDatagramSize = 1500;
/** @brief Default UDP port for both roles. */
constexpr uint16_t kDefaultPort = 55555;

using EncodedTimestamp = std::array<uint8_t, kTimestampSize>;

/**
 * @brief Encode a timestamp as sec || nsec, little-endian int64 each.
 * @param ts Timestamp to encode.
 * @return 16 raw bytes.
 */
EncodedTimestamp EncodeTimestamp(const TimeSpec& ts);

/**
 * @brief Decode a timestamp from the first 16 bytes of a buffer.
 * @param data Input bytes (may be null when size is 0).
 * @param size Number of readable bytes at data.
 * @param out Decoded timestamp on success; untouched on failure.
 * @return false if fewer than 16 bytes are available.
 */
bool DecodeTimestamp(const uint8_t* data, size_t size, TimeSpec* out);

/**
 * @brief Build a request datagram carrying the emitter capture t1.
 */
std::vector<uint8_t> EncodeRequest(const TimeSpec& t1);

/**
 * @brief Build a reply from the raw request bytes and the reflector capture.
 *
 * The request bytes are copied verbatim (never decoded and re-encoded).
 *
 * @param request Raw request datagram (must be exactly kRequestSize bytes).
 * @param tau2 Reflector capture time.
 * @param out Reply bytes on success; untouched on failure.
 * @return false if request has the wrong length.
 */
bool BuildReply(const std::vector<uint8_t>& request, const TimeSpec& tau2,
                std::vector<uint8_t>* out);

/**
 * @brief Split a reply datagram into its two timestamps.
 * @param reply Raw reply bytes (must be exactly kReplySize bytes).
 * @param t1 Echoed emitter capture.
 * @param tau2 Reflector capture.
 * @return false if reply has the wrong length; outputs untouched.
 */
bool ParseReply(const std::vector<uint8_t>& reply, TimeSpec* t1,
                TimeSpec* tau2);

}  // namespace udpoffset
