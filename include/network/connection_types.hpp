// Copyright (c) 2025 The Unicity Foundation
// Connection types for peer-to-peer network connections

#pragma once

#include <cstdint>
#include <string>

namespace peernet {
namespace network {

// Process-unique identifier of a registered connection (never reused)
using ConnectionId = uint64_t;

/**
 * Which side initiated the transport connection.
 * Inbound connections were accepted by one of our listeners; outbound
 * connections were dialed by us through try_connect.
 */
enum class Direction {
  INBOUND,
  OUTBOUND,
};

/**
 * Lifecycle of a connection attempt:
 *
 *   RESERVED -> HANDSHAKING -> ESTABLISHED -> CLOSING -> CLOSED
 *
 * RESERVED and HANDSHAKING belong to an in-flight attempt that holds a slot
 * but is not yet in the registry map. A failure in either goes straight to
 * CLOSED and returns the slot. ESTABLISHED is entered when the verified
 * connection is registered; CLOSING on close request or I/O error; CLOSED
 * once the socket is torn down, immediately before the slot is released.
 */
enum class ConnectionState {
  RESERVED,
  HANDSHAKING,
  ESTABLISHED,
  CLOSING,
  CLOSED,
};

std::string DirectionAsString(Direction direction);

std::string ConnectionStateAsString(ConnectionState state);

inline bool IsOutbound(Direction direction) {
  return direction == Direction::OUTBOUND;
}

}  // namespace network
}  // namespace peernet
