// Copyright (c) 2025 The Unicity Foundation
// Connection types implementation

#include "network/connection_types.hpp"

namespace peernet {
namespace network {

std::string DirectionAsString(Direction direction) {
  switch (direction) {
  case Direction::INBOUND:
    return "inbound";
  case Direction::OUTBOUND:
    return "outbound";
  default:
    return "unknown";
  }
}

std::string ConnectionStateAsString(ConnectionState state) {
  switch (state) {
  case ConnectionState::RESERVED:
    return "reserved";
  case ConnectionState::HANDSHAKING:
    return "handshaking";
  case ConnectionState::ESTABLISHED:
    return "established";
  case ConnectionState::CLOSING:
    return "closing";
  case ConnectionState::CLOSED:
    return "closed";
  default:
    return "unknown";
  }
}

}  // namespace network
}  // namespace peernet
