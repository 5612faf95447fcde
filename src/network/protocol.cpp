// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/protocol.hpp"

namespace peernet {
namespace protocol {

std::array<uint8_t, FRAME_HEADER_SIZE> EncodeFrameHeader(uint32_t payload_size) {
  return {static_cast<uint8_t>(payload_size >> 24), static_cast<uint8_t>(payload_size >> 16),
          static_cast<uint8_t>(payload_size >> 8), static_cast<uint8_t>(payload_size)};
}

uint32_t DecodeFrameHeader(const std::array<uint8_t, FRAME_HEADER_SIZE>& header) {
  return (static_cast<uint32_t>(header[0]) << 24) | (static_cast<uint32_t>(header[1]) << 16) |
         (static_cast<uint32_t>(header[2]) << 8) | static_cast<uint32_t>(header[3]);
}

}  // namespace protocol
}  // namespace peernet
