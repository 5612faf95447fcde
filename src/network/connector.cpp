// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/connector.hpp"

#include "util/logging.hpp"

#include <future>

namespace peernet {
namespace network {

namespace {

// State of one outbound attempt, shared by the dial and handshake handlers
struct OutboundAttempt {
  std::shared_ptr<const SessionContext> context;
  ReservationToken token;
  TransportKind kind;
  std::promise<ConnectResult> promise;

  void Fail(Status status) {
    if (token.valid())
      context->registry->AbortReservation(std::move(token));
    promise.set_value(ConnectResult{std::move(status), 0});
  }
};

}  // namespace

Connector::Connector(std::shared_ptr<const SessionContext> context) : context_(std::move(context)) {}

ConnectResult Connector::TryConnect(Transport& transport, const NetworkAddress& address,
                                    std::chrono::milliseconds timeout, const OutConnectionConfig& out_config) {
  if (TransportKindOf(out_config) != transport.kind()) {
    return ConnectResult{Status::Error(NetResult::WrongConfigType,
                                       "config for " + TransportKindAsString(TransportKindOf(out_config)) +
                                           " given to " + TransportKindAsString(transport.kind()) + " transport"),
                         0};
  }
  if (context_->io_context.get_executor().running_in_this_thread()) {
    LOG_NET_ERROR("try_connect called from a reactor thread; refusing to block it");
    return ConnectResult{Status::Error(NetResult::Io, "try_connect must not run on a reactor thread"), 0};
  }
  if (context_->registry->is_shutting_down()) {
    return ConnectResult{Status::Error(NetResult::ShuttingDown, "manager is shutting down"), 0};
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  Status refusal;
  auto token = context_->registry->TryReserve(Direction::OUTBOUND, CanonicalHost(address.host), &refusal);
  if (!token) {
    LOG_NET_DEBUG("not dialing {}: {}", address.ToString(), refusal.detail);
    return ConnectResult{std::move(refusal), 0};
  }

  auto attempt = std::make_shared<OutboundAttempt>(
      OutboundAttempt{context_, std::move(*token), transport.kind(), std::promise<ConnectResult>{}});
  auto future = attempt->promise.get_future();

  LOG_NET_DEBUG("dialing {} (timeout {} ms)", address.ToString(), timeout.count());

  transport.AsyncConnect(address, out_config, deadline, [attempt, deadline](Status status, RawSocket socket) {
    if (!status.ok()) {
      attempt->Fail(std::move(status));
      return;
    }
    auto session = HandshakeSession::Create(std::move(socket), Direction::OUTBOUND,
                                            attempt->context->local_keypair, deadline);
    session->Start([attempt](Status status, std::optional<HandshakeResult> result) {
      if (!status.ok()) {
        attempt->Fail(std::move(status));
        return;
      }
      attempt->promise.set_value(
          EstablishConnection(attempt->context, std::move(attempt->token), std::move(*result), attempt->kind));
    });
  });

  try {
    auto result = future.get();
    if (!result.ok()) {
      LOG_NET_DEBUG("connection to {} failed: {}", address.ToString(), result.status.ToString());
    }
    return result;
  } catch (const std::future_error& e) {
    // Handlers were destroyed without running: the io_context is gone
    LOG_NET_WARN("connection attempt to {} abandoned: {}", address.ToString(), e.what());
    return ConnectResult{Status::Error(NetResult::ShuttingDown, "attempt abandoned during shutdown"), 0};
  }
}

}  // namespace network
}  // namespace peernet
