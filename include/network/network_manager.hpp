// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/config.hpp"
#include "network/connection.hpp"
#include "network/connection_registry.hpp"
#include "network/connector.hpp"
#include "network/listener.hpp"
#include "network/net_error.hpp"
#include "network/session.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

namespace peernet {
namespace network {

// NetworkManager - public facade of the connection layer
//
// Owns the listeners, the connection registry and the shared reactor
// (io_context + Config::io_threads threads) on which handshakes and
// established connections run. Each listener runs its own accept thread.
//
// Thread-safety: every public method may be called concurrently from any
// thread other than a reactor thread. try_connect() blocks its caller.
//
// Destruction:
// 1. the registry stops accepting reservations and registrations
// 2. all listeners are stopped (accept threads joined)
// 3. every registered connection is closed and its slot released
// 4. the reactor is stopped and its threads joined
// Calling try_connect() concurrently with destruction is not supported.
class NetworkManager {
public:
  // Throws std::invalid_argument if io_threads or max_message_size is 0
  explicit NetworkManager(PeerNetConfiguration config);
  ~NetworkManager();

  NetworkManager(const NetworkManager&) = delete;
  NetworkManager& operator=(const NetworkManager&) = delete;

  // Listener lifecycle
  Status start_listener(TransportKind kind, const NetworkAddress& address);
  Status stop_listener(TransportKind kind, const NetworkAddress& address);

  // Outbound
  ConnectResult try_connect(const NetworkAddress& address, std::chrono::milliseconds timeout,
                            const OutConnectionConfig& out_config = TcpConnectionConfig{});
  std::vector<ConnectResult> connect_initial_peers(std::chrono::milliseconds timeout);

  // Established connections
  std::vector<ConnectionSummary> connections_snapshot() const;
  Status close_connection(ConnectionId id);  // Unknown/closed ids: Success
  Status send_to(ConnectionId id, std::vector<uint8_t> payload);

  // Introspection
  std::vector<ListenerInfo> listeners() const;
  std::optional<uint16_t> listening_port(TransportKind kind, const NetworkAddress& address) const;
  size_t inbound_count() const { return registry_->inbound_count(); }
  size_t outbound_count() const { return registry_->outbound_count(); }
  uint64_t total_bytes_sent() const { return totals_->bytes_sent.load(std::memory_order_relaxed); }
  uint64_t total_bytes_received() const { return totals_->bytes_received.load(std::memory_order_relaxed); }
  const PeerIdentity& local_identity() const { return local_identity_; }
  const PeerNetConfiguration& config() const { return config_; }

  // JSON array describing live connections (diagnostics)
  nlohmann::json get_peer_info() const;

private:
  using ListenerKey = std::pair<TransportKind, NetworkAddress>;

  Transport* transport_for(TransportKind kind) const;

  const PeerNetConfiguration config_;
  const PeerIdentity local_identity_;

  asio::io_context io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> io_threads_;

  std::shared_ptr<TrafficCounters> totals_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<const SessionContext> session_context_;
  std::map<TransportKind, std::unique_ptr<Transport>> transports_;
  std::unique_ptr<Connector> connector_;

  mutable std::mutex listeners_mutex_;
  std::map<ListenerKey, std::unique_ptr<Listener>> listeners_;
};

}  // namespace network
}  // namespace peernet
