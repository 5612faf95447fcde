// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/net_error.hpp"

namespace peernet {
namespace network {

std::string NetResultAsString(NetResult result) {
  switch (result) {
  case NetResult::Success:
    return "success";
  case NetResult::BindFailed:
    return "bind-failed";
  case NetResult::AlreadyListening:
    return "already-listening";
  case NetResult::ListenerNotFound:
    return "listener-not-found";
  case NetResult::LimitReached:
    return "limit-reached";
  case NetResult::DialFailed:
    return "dial-failed";
  case NetResult::DialTimedOut:
    return "dial-timed-out";
  case NetResult::HandshakeFailed:
    return "handshake-failed";
  case NetResult::InvalidKey:
    return "invalid-key";
  case NetResult::Io:
    return "io";
  case NetResult::WrongConfigType:
    return "wrong-config-type";
  case NetResult::DuplicateConnection:
    return "duplicate-connection";
  case NetResult::ShuttingDown:
    return "shutting-down";
  default:
    return "unknown";
  }
}

std::string Status::ToString() const {
  std::string out = NetResultAsString(code);
  if (direction) {
    out += " (" + DirectionAsString(*direction) + ")";
  }
  if (!detail.empty()) {
    out += ": " + detail;
  }
  return out;
}

}  // namespace network
}  // namespace peernet
