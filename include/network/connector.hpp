// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/net_error.hpp"
#include "network/session.hpp"
#include "network/transport.hpp"

#include <chrono>
#include <memory>

namespace peernet {
namespace network {

/**
 * Connector - synchronous outbound connection attempts
 *
 * TryConnect() blocks the calling thread while the dial and handshake run
 * on the shared io_context, and returns once the attempt has finished:
 * - LimitReached if no OUTBOUND slot is free (nothing is dialed)
 * - DialFailed / DialTimedOut / HandshakeFailed / Io on failure, with the
 *   slot already returned
 * - Success with the new connection id, already registered
 *
 * One deadline (now + timeout) bounds dial and handshake together.
 * Must not be called from a thread running the shared io_context.
 */
class Connector {
public:
  explicit Connector(std::shared_ptr<const SessionContext> context);

  ConnectResult TryConnect(Transport& transport, const NetworkAddress& address, std::chrono::milliseconds timeout,
                           const OutConnectionConfig& out_config);

private:
  std::shared_ptr<const SessionContext> context_;
};

}  // namespace network
}  // namespace peernet
