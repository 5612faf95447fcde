// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/listener.hpp"

#include "util/logging.hpp"

namespace peernet {
namespace network {

std::string ListenerStateAsString(ListenerState state) {
  switch (state) {
  case ListenerState::RUNNING:
    return "running";
  case ListenerState::FAILED:
    return "failed";
  case ListenerState::STOPPED:
    return "stopped";
  default:
    return "unknown";
  }
}

bool IsFatalAcceptError(const asio::error_code& ec) {
  return ec == asio::error::bad_descriptor || ec == asio::error::invalid_argument ||
         ec == asio::error::not_socket || ec == asio::error::operation_not_supported;
}

std::unique_ptr<Listener> Listener::Start(Transport& transport, const NetworkAddress& address,
                                          std::shared_ptr<const SessionContext> context, Status& status) {
  std::unique_ptr<Listener> listener(new Listener(transport.kind(), address, std::move(context)));

  listener->acceptor_ = transport.Bind(listener->io_context_, address, status);
  if (!listener->acceptor_) {
    return nullptr;
  }
  listener->bound_port_ = listener->acceptor_->local_address().port;

  Listener* self = listener.get();
  self->start_accept();
  self->thread_ = std::thread([self]() {
    self->io_context_.run();
    LOG_NET_DEBUG("accept loop for {} exited", self->address_.ToString());
  });

  status = Status::Ok();
  return listener;
}

Listener::Listener(TransportKind kind, const NetworkAddress& address, std::shared_ptr<const SessionContext> context)
    : kind_(kind), address_(address), context_(std::move(context)) {}

Listener::~Listener() {
  Stop();
}

void Listener::Stop() {
  if (stop_requested_.exchange(true)) {
    // Another caller already stopped us; still make sure the thread is gone
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
      thread_.join();
    return;
  }
  if (!acceptor_) {
    return;  // Never bound
  }

  asio::post(io_context_, [this]() {
    if (acceptor_)
      acceptor_->Close();
  });

  if (thread_.joinable())
    thread_.join();

  // The loop may have ended earlier (FAILED) without running the post
  if (acceptor_)
    acceptor_->Close();

  ListenerState expected = ListenerState::RUNNING;
  state_.compare_exchange_strong(expected, ListenerState::STOPPED);

  LOG_NET_INFO("stopped listening on {}", address_.ToString());
}

ListenerInfo Listener::info() const {
  return ListenerInfo{kind_, address_, bound_port_, state(), accepted_.load(), rejected_.load()};
}

void Listener::start_accept() {
  acceptor_->AsyncAccept(
      [this](const asio::error_code& ec, RawSocket socket) { handle_accept(ec, std::move(socket)); });
}

void Listener::handle_accept(const asio::error_code& ec, RawSocket socket) {
  if (stop_requested_.load(std::memory_order_acquire) || ec == asio::error::operation_aborted) {
    return;
  }

  if (ec) {
    if (IsFatalAcceptError(ec) || !acceptor_->is_open()) {
      LOG_NET_ERROR("listener on {} failed: {}", address_.ToString(), ec.message());
      state_.store(ListenerState::FAILED, std::memory_order_release);
      return;
    }
    LOG_NET_WARN_RL("accept error on {}: {}", address_.ToString(), ec.message());
    start_accept();
    return;
  }

  accepted_.fetch_add(1, std::memory_order_relaxed);
  handle_inbound(std::move(socket));
  start_accept();
}

void Listener::handle_inbound(RawSocket socket) {
  asio::error_code ep_ec;
  auto endpoint = socket.remote_endpoint(ep_ec);
  if (ep_ec) {
    // Peer already gone; nothing to count it against
    rejected_.fetch_add(1, std::memory_order_relaxed);
    LOG_NET_TRACE("dropping accepted socket on {}: {}", address_.ToString(), ep_ec.message());
    asio::error_code ec;
    socket.close(ec);
    return;
  }
  const std::string remote_host = CanonicalHost(endpoint.address());

  auto refuse = [this, &socket, &remote_host](const std::string& reason) {
    rejected_.fetch_add(1, std::memory_order_relaxed);
    LOG_NET_DEBUG("refusing inbound connection from {} on {}: {}", remote_host, address_.ToString(), reason);
    asio::error_code ec;
    socket.close(ec);
    if (ec) {
      LOG_NET_TRACE("close of refused socket failed: {}", ec.message());
    }
  };

  if (context_->reject_same_ip_addr && context_->registry->HasInboundFromHost(remote_host)) {
    refuse("already connected to this host");
    return;
  }

  Status refusal;
  auto token = context_->registry->TryReserve(Direction::INBOUND, remote_host, &refusal);
  if (!token) {
    refuse(refusal.detail);
    return;
  }

  // Shared so the move-only token can ride in a copyable handler
  auto reservation = std::make_shared<ReservationToken>(std::move(*token));
  auto context = context_;
  const TransportKind kind = kind_;
  const auto deadline = std::chrono::steady_clock::now() + context_->handshake_timeout;

  auto session = HandshakeSession::Create(std::move(socket), Direction::INBOUND, context_->local_keypair, deadline);
  session->Start([reservation, context, kind](Status status, std::optional<HandshakeResult> result) {
    if (!status.ok()) {
      context->registry->AbortReservation(std::move(*reservation));
      return;
    }
    auto outcome = EstablishConnection(context, std::move(*reservation), std::move(*result), kind);
    if (!outcome.ok()) {
      LOG_NET_DEBUG("inbound connection not registered: {}", outcome.status.ToString());
    }
  });
}

}  // namespace network
}  // namespace peernet
