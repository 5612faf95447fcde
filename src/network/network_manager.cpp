// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/network_manager.hpp"

#include "util/logging.hpp"
#include "util/time.hpp"

#include <stdexcept>

namespace peernet {
namespace network {

namespace {

PeerNetConfiguration ValidateConfig(PeerNetConfiguration config) {
  if (config.io_threads == 0) {
    throw std::invalid_argument("PeerNetConfiguration::io_threads must be at least 1");
  }
  if (config.max_message_size == 0) {
    throw std::invalid_argument("PeerNetConfiguration::max_message_size must be non-zero");
  }
  if (config.rate_limit > 0 && config.rate_time_window.count() <= 0) {
    throw std::invalid_argument("PeerNetConfiguration::rate_time_window must be positive when rate_limit is set");
  }
  return config;
}

Connection::Options ConnectionOptionsOf(const PeerNetConfiguration& config) {
  Connection::Options options{config.max_message_size, config.send_queue_limit};
  options.read_timeout = config.read_timeout;
  options.write_timeout = config.write_timeout;
  options.rate_limit = config.rate_limit;
  options.rate_time_window = config.rate_time_window;
  options.rate_bucket_size = config.rate_bucket_size;
  return options;
}

}  // namespace

NetworkManager::NetworkManager(PeerNetConfiguration config)
    : config_(ValidateConfig(std::move(config))),
      local_identity_(config_.local_peer_id()),
      totals_(std::make_shared<TrafficCounters>()),
      registry_(ConnectionRegistry::Create(config_.max_in_connections, config_.max_out_connections,
                                           PeerCategoryTable(config_.peers_categories, config_.default_category_info))) {
  session_context_ = std::make_shared<const SessionContext>(
      SessionContext{io_context_,
                     config_.local_keypair,
                     local_identity_,
                     registry_,
                     ConnectionOptionsOf(config_),
                     config_.handshake_timeout,
                     config_.features.reject_same_ip_addr,
                     config_.message_handler,
                     totals_});

  transports_.emplace(TransportKind::TCP, CreateTransport(TransportKind::TCP, io_context_));
  connector_ = std::make_unique<Connector>(session_context_);

  work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
      asio::make_work_guard(io_context_));
  for (size_t i = 0; i < config_.io_threads; ++i) {
    io_threads_.emplace_back([this]() { io_context_.run(); });
  }

  LOG_NET_INFO("network manager started (peer {}, max in {}, max out {}, {} peer categories, {} io threads)",
               local_identity_.ShortString(), config_.max_in_connections, config_.max_out_connections,
               registry_->categories().category_count(), config_.io_threads);
}

NetworkManager::~NetworkManager() {
  LOG_NET_DEBUG("network manager shutting down");

  // 1. Refuse new reservations/registrations; in-flight handshakes fail
  registry_->Shutdown();

  // 2. Stop accepting
  std::map<ListenerKey, std::unique_ptr<Listener>> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners.swap(listeners_);
  }
  for (auto& [key, listener] : listeners) {
    listener->Stop();
  }
  listeners.clear();

  // 3. Close every connection while the reactor still runs, so close
  //    handlers release their slots
  for (const auto& conn : registry_->GetAll()) {
    conn->CloseAndWait();
  }

  // 4. Stop the reactor
  work_guard_.reset();
  io_context_.stop();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  LOG_NET_INFO("network manager stopped");
}

Transport* NetworkManager::transport_for(TransportKind kind) const {
  auto it = transports_.find(kind);
  return it == transports_.end() ? nullptr : it->second.get();
}

Status NetworkManager::start_listener(TransportKind kind, const NetworkAddress& address) {
  Transport* transport = transport_for(kind);
  if (transport == nullptr) {
    return Status::Error(NetResult::WrongConfigType, "no transport for " + TransportKindAsString(kind));
  }

  std::lock_guard<std::mutex> lock(listeners_mutex_);
  ListenerKey key{kind, address};
  auto existing = listeners_.find(key);
  if (existing != listeners_.end()) {
    if (existing->second->state() != ListenerState::FAILED) {
      return Status::Error(NetResult::AlreadyListening,
                           TransportKindAsString(kind) + " listener already active on " + address.ToString());
    }
    // A failed accept loop has already exited; replace it with a fresh bind
    LOG_NET_INFO("replacing failed listener on {}", address.ToString());
    existing->second->Stop();
    listeners_.erase(existing);
  }

  Status status;
  auto listener = Listener::Start(*transport, address, session_context_, status);
  if (!listener) {
    return status;
  }
  listeners_.emplace(std::move(key), std::move(listener));
  return Status::Ok();
}

Status NetworkManager::stop_listener(TransportKind kind, const NetworkAddress& address) {
  std::unique_ptr<Listener> listener;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto it = listeners_.find(ListenerKey{kind, address});
    if (it == listeners_.end()) {
      return Status::Error(NetResult::ListenerNotFound,
                           "no " + TransportKindAsString(kind) + " listener on " + address.ToString());
    }
    listener = std::move(it->second);
    listeners_.erase(it);
  }
  // Join outside the lock
  listener->Stop();
  return Status::Ok();
}

ConnectResult NetworkManager::try_connect(const NetworkAddress& address, std::chrono::milliseconds timeout,
                                          const OutConnectionConfig& out_config) {
  Transport* transport = transport_for(TransportKindOf(out_config));
  if (transport == nullptr) {
    return ConnectResult{Status::Error(NetResult::WrongConfigType, "no transport for outbound config"), 0};
  }
  return connector_->TryConnect(*transport, address, timeout, out_config);
}

std::vector<ConnectResult> NetworkManager::connect_initial_peers(std::chrono::milliseconds timeout) {
  std::vector<ConnectResult> results;
  results.reserve(config_.initial_peer_list.size());
  for (const auto& peer : config_.initial_peer_list) {
    OutConnectionConfig out_config = TcpConnectionConfig{};
    if (peer.kind != TransportKindOf(out_config)) {
      results.push_back(ConnectResult{Status::Error(NetResult::WrongConfigType, "unsupported transport"), 0});
      continue;
    }
    results.push_back(try_connect(peer.address, timeout, out_config));
    if (!results.back().ok()) {
      LOG_NET_WARN("initial peer {} unreachable: {}", peer.address.ToString(), results.back().status.ToString());
    }
  }
  return results;
}

std::vector<ConnectionSummary> NetworkManager::connections_snapshot() const {
  return registry_->Snapshot();
}

Status NetworkManager::close_connection(ConnectionId id) {
  auto conn = registry_->Get(id);
  if (!conn) {
    return Status::Ok();
  }
  conn->CloseAndWait();
  return Status::Ok();
}

Status NetworkManager::send_to(ConnectionId id, std::vector<uint8_t> payload) {
  auto conn = registry_->Get(id);
  if (!conn) {
    return Status::Error(NetResult::Io, "unknown connection " + std::to_string(id));
  }
  if (!conn->Send(std::move(payload))) {
    return Status::Error(NetResult::Io, "connection " + std::to_string(id) + " cannot send");
  }
  return Status::Ok();
}

std::vector<ListenerInfo> NetworkManager::listeners() const {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  std::vector<ListenerInfo> result;
  result.reserve(listeners_.size());
  for (const auto& [key, listener] : listeners_) {
    result.push_back(listener->info());
  }
  return result;
}

std::optional<uint16_t> NetworkManager::listening_port(TransportKind kind, const NetworkAddress& address) const {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  auto it = listeners_.find(ListenerKey{kind, address});
  if (it == listeners_.end()) {
    return std::nullopt;
  }
  return it->second->bound_port();
}

nlohmann::json NetworkManager::get_peer_info() const {
  using json = nlohmann::json;
  const auto now = util::GetSteadyTime();

  json peers = json::array();
  for (const auto& summary : registry_->Snapshot()) {
    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - summary.established_at);
    peers.push_back(json{
        {"id", summary.id},
        {"transport", TransportKindAsString(summary.kind)},
        {"addr", summary.remote_address.ToString()},
        {"inbound", summary.direction == Direction::INBOUND},
        {"peer_id", summary.remote_identity.ToString()},
        {"state", ConnectionStateAsString(summary.state)},
        {"bytessent", summary.bytes_sent},
        {"bytesrecv", summary.bytes_received},
        {"conntime", age.count()},
    });
  }
  return peers;
}

}  // namespace network
}  // namespace peernet
