// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/connection_types.hpp"

#include <optional>
#include <string>
#include <utility>

namespace peernet {
namespace network {

// Outcome codes for listener, dial, handshake and registry operations
enum class NetResult {
  Success,
  BindFailed,           // Address in use, permission denied or invalid
  AlreadyListening,     // A listener for (kind, address) is already active
  ListenerNotFound,     // stop_listener on an unknown (kind, address)
  LimitReached,         // No free slot for the direction
  DialFailed,           // Refused, unreachable or unresolvable
  DialTimedOut,         // Deadline elapsed before the attempt completed
  HandshakeFailed,      // Remote peer failed the identity exchange
  InvalidKey,           // Malformed public key
  Io,                   // Generic transport I/O fault
  WrongConfigType,      // Outbound config does not match the transport kind
  DuplicateConnection,  // Another connection to the same peer was kept
  ShuttingDown          // Manager is being destroyed
};

std::string NetResultAsString(NetResult result);

// Status - result of an operation that can fail for a reportable reason.
// direction is set for LimitReached; detail carries the underlying reason
// (OS error text, handshake failure reason) for logs and callers.
struct Status {
  NetResult code{NetResult::Success};
  std::optional<Direction> direction;
  std::string detail;

  bool ok() const { return code == NetResult::Success; }

  std::string ToString() const;

  static Status Ok() { return Status{}; }
  static Status Error(NetResult code, std::string detail = {}) { return Status{code, std::nullopt, std::move(detail)}; }
  static Status LimitReached(Direction direction) {
    return Status{NetResult::LimitReached, direction, "no free " + DirectionAsString(direction) + " slot"};
  }
  static Status LimitReached(Direction direction, std::string detail) {
    return Status{NetResult::LimitReached, direction, std::move(detail)};
  }
};

// Result of try_connect: the id is valid only when status.ok()
struct ConnectResult {
  Status status;
  ConnectionId connection_id{0};

  bool ok() const { return status.ok(); }
};

}  // namespace network
}  // namespace peernet
