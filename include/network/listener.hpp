// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Listener - accept loop for one (transport kind, bind address)

 Runs on its own thread and io_context so a slow or stuck reactor cannot
 delay accepting. Accepted sockets are created on the shared io_context,
 where their handshakes and established connections run.

 Per accepted socket:
 1. reject_same_ip_addr: refuse hosts that already have a connection
 2. reserve an INBOUND slot; when none is free the socket is closed
    immediately without a handshake
 3. run the handshake (deadline = handshake_timeout) off the accept thread
 4. register the verified connection; any failure frees the slot

 A per-connection accept error (e.g. ECONNABORTED, EMFILE) is logged and the
 loop continues. An error that invalidates the listening socket ends the loop
 and leaves the listener in FAILED state.

 Stop() closes the listening socket and joins the thread. Connections already
 accepted through this listener are not affected.
*/

#include "network/session.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <asio.hpp>

namespace peernet {
namespace network {

enum class ListenerState {
  RUNNING,
  FAILED,
  STOPPED,
};

std::string ListenerStateAsString(ListenerState state);

struct ListenerInfo {
  TransportKind kind{TransportKind::TCP};
  NetworkAddress address;  // Address requested by start_listener
  uint16_t bound_port{0};  // Actual port (resolves port 0)
  ListenerState state{ListenerState::STOPPED};
  uint64_t accepted{0};  // Sockets accepted
  uint64_t rejected{0};  // Sockets refused before the handshake
};

class Listener {
public:
  // Bind and start the accept thread. Returns nullptr and sets status on failure.
  static std::unique_ptr<Listener> Start(Transport& transport, const NetworkAddress& address,
                                         std::shared_ptr<const SessionContext> context, Status& status);

  ~Listener();

  Listener(const Listener&) = delete;
  Listener& operator=(const Listener&) = delete;

  // Close the listening socket and join the accept thread. Idempotent.
  void Stop();

  ListenerState state() const { return state_.load(std::memory_order_acquire); }
  uint16_t bound_port() const { return bound_port_; }
  ListenerInfo info() const;

private:
  Listener(TransportKind kind, const NetworkAddress& address, std::shared_ptr<const SessionContext> context);

  void start_accept();
  void handle_accept(const asio::error_code& ec, RawSocket socket);
  void handle_inbound(RawSocket socket);

  const TransportKind kind_;
  const NetworkAddress address_;
  std::shared_ptr<const SessionContext> context_;

  asio::io_context io_context_;
  std::unique_ptr<Acceptor> acceptor_;
  std::thread thread_;
  uint16_t bound_port_{0};

  std::atomic<bool> stop_requested_{false};
  std::atomic<ListenerState> state_{ListenerState::RUNNING};
  std::atomic<uint64_t> accepted_{0};
  std::atomic<uint64_t> rejected_{0};
};

// True for accept errors after which the listening socket is unusable
bool IsFatalAcceptError(const asio::error_code& ec);

}  // namespace network
}  // namespace peernet
