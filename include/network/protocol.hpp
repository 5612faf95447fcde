// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace peernet {
namespace protocol {

// Handshake protocol version - increment when the identity exchange changes
constexpr uint8_t HANDSHAKE_VERSION = 1;

// HELLO magic: ASCII "PNET"
constexpr std::array<uint8_t, 4> HANDSHAKE_MAGIC = {0x50, 0x4E, 0x45, 0x54};

// Domain separation prefix for PROOF signatures
constexpr char HANDSHAKE_CONTEXT[] = "peernet-handshake-v1";

constexpr size_t NONCE_SIZE = 32;

// Every frame starts with a 4-byte big-endian payload length
constexpr size_t FRAME_HEADER_SIZE = 4;

// HELLO = magic(4) | version(1) | public key(32) | nonce(32)
constexpr size_t HELLO_SIZE = 4 + 1 + 32 + NONCE_SIZE;

// PROOF = Ed25519 signature
constexpr size_t PROOF_SIZE = 64;

// ============================================================================
// LIMITS AND DEFAULTS
// ============================================================================

// Largest frame accepted on an established connection
constexpr uint32_t DEFAULT_MAX_MESSAGE_SIZE = 1024 * 1024;  // 1 MiB

// Per-connection send queue cap; a slow reader exceeding it is disconnected
constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 5 * 1000 * 1000;  // 5 MB

// Inbound handshake deadline (outbound attempts use the caller's timeout)
constexpr std::chrono::seconds DEFAULT_HANDSHAKE_TIMEOUT{10};

// Once a frame header has arrived its payload must follow within the read
// timeout; a queued frame must be written out within the write timeout.
// Zero disables either.
constexpr std::chrono::seconds DEFAULT_READ_TIMEOUT{7};
constexpr std::chrono::seconds DEFAULT_WRITE_TIMEOUT{7};

// Per-connection, per-direction bandwidth shaping: RATE_LIMIT bytes per
// RATE_TIME_WINDOW with bursts up to RATE_BUCKET_SIZE. Rate 0 = unlimited.
constexpr uint64_t DEFAULT_RATE_LIMIT = 0;
constexpr std::chrono::milliseconds DEFAULT_RATE_TIME_WINDOW{1000};
constexpr uint64_t DEFAULT_RATE_BUCKET_SIZE = 10 * 1024;

// Reactor threads running handshakes and established connections
constexpr size_t DEFAULT_IO_THREADS = 1;

// Encode a frame header for a payload of the given length
std::array<uint8_t, FRAME_HEADER_SIZE> EncodeFrameHeader(uint32_t payload_size);

// Decode a frame header; the caller enforces size limits
uint32_t DecodeFrameHeader(const std::array<uint8_t, FRAME_HEADER_SIZE>& header);

}  // namespace protocol
}  // namespace peernet
