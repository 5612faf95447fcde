// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/keypair.hpp"
#include "network/connection.hpp"
#include "network/connection_registry.hpp"
#include "network/handshake.hpp"
#include "network/net_error.hpp"
#include "network/peer_identity.hpp"
#include "network/transport.hpp"

#include <chrono>
#include <memory>

#include <asio.hpp>

namespace peernet {
namespace network {

// State shared by listeners and the connector for turning raw sockets into
// registered connections. Immutable after construction; held by shared_ptr
// so in-flight handshakes keep it alive.
struct SessionContext {
  asio::io_context& io_context;
  crypto::KeyPair local_keypair;
  PeerIdentity local_identity;
  std::shared_ptr<ConnectionRegistry> registry;
  Connection::Options connection_options;
  std::chrono::milliseconds handshake_timeout;
  bool reject_same_ip_addr;
  Connection::FrameHandler message_handler;
  std::shared_ptr<TrafficCounters> totals;
};

// Wrap a verified handshake in a Connection, register it (consuming token)
// and start its read loop. A connection displaced by the duplicate
// tie-break is closed. On a refused registration the new socket is closed
// and the refusal status is returned.
ConnectResult EstablishConnection(const std::shared_ptr<const SessionContext>& context, ReservationToken token,
                                  HandshakeResult handshake, TransportKind kind);

}  // namespace network
}  // namespace peernet
