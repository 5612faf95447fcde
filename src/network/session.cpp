// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/session.hpp"

#include "util/logging.hpp"

namespace peernet {
namespace network {

ConnectResult EstablishConnection(const std::shared_ptr<const SessionContext>& context, ReservationToken token,
                                  HandshakeResult handshake, TransportKind kind) {
  std::weak_ptr<ConnectionRegistry> weak_registry = context->registry;
  auto conn = Connection::Create(context->io_context, std::move(handshake), kind, context->connection_options,
                                 context->totals, [weak_registry](ConnectionId id) {
                                   if (auto registry = weak_registry.lock())
                                     registry->Release(id);
                                 });

  auto outcome = context->registry->RegisterUnique(std::move(token), conn, context->local_identity);
  if (!outcome.ok()) {
    conn->Close();
    return ConnectResult{outcome.status, 0};
  }

  if (outcome.displaced) {
    LOG_NET_DEBUG("connection {} to peer {} replaces {} connection {}", outcome.id,
                  conn->remote_identity().ShortString(), DirectionAsString(outcome.displaced->direction()),
                  outcome.displaced->id());
    outcome.displaced->Close();
  }

  LOG_NET_INFO("{} connection {} established with peer {} ({})", DirectionAsString(conn->direction()), outcome.id,
               conn->remote_identity().ShortString(), conn->remote_address().ToString());

  conn->Start(context->message_handler);
  return ConnectResult{Status::Ok(), outcome.id};
}

}  // namespace network
}  // namespace peernet
