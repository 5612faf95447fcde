// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/keypair.hpp"
#include "network/connection_types.hpp"
#include "network/peer_category.hpp"
#include "network/peer_identity.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace peernet {
namespace network {

// Invoked on a reactor thread for every frame received on an established
// connection. Must not block; may call send_to()/close_connection().
using MessageHandler = std::function<void(ConnectionId id, const PeerIdentity& peer, std::vector<uint8_t> payload)>;

struct InitialPeer {
  NetworkAddress address;
  TransportKind kind{TransportKind::TCP};
};

struct PeerNetFeatures {
  // Refuse an inbound connection from a host that already has an
  // established inbound connection with us. Hosts compare in canonical form,
  // so ::ffff:10.0.0.1 and 10.0.0.1 are the same host.
  bool reject_same_ip_addr{false};
};

// PeerNetConfiguration - immutable settings of one NetworkManager
struct PeerNetConfiguration {
  size_t max_in_connections;   // Inbound slot limit (0 = refuse all inbound)
  size_t max_out_connections;  // Outbound slot limit (0 = no dialing)
  crypto::KeyPair local_keypair;

  std::vector<InitialPeer> initial_peer_list;  // Dialed by connect_initial_peers()

  std::chrono::milliseconds handshake_timeout;  // Inbound handshake deadline
  uint32_t max_message_size;                    // Largest frame in either direction
  size_t send_queue_limit;                      // Per-connection queued bytes before disconnect
  size_t io_threads;                            // Reactor threads (must be >= 1)

  std::chrono::milliseconds read_timeout;   // Payload must follow its header within this (0 = off)
  std::chrono::milliseconds write_timeout;  // One queued frame must be written within this (0 = off)

  // Per-connection bandwidth, applied to each direction separately
  uint64_t rate_limit;                         // Bytes per rate_time_window (0 = unlimited)
  std::chrono::milliseconds rate_time_window;  // Must be > 0 when rate_limit is set
  uint64_t rate_bucket_size;                   // Burst allowance (0 = one window's worth)

  // Named host groups with their own limits; hosts in no group use
  // default_category_info. Checked together with the global limits.
  PeerNetCategories peers_categories;
  PeerNetCategoryInfo default_category_info;

  PeerNetFeatures features;
  MessageHandler message_handler;

  explicit PeerNetConfiguration(crypto::KeyPair keypair)
      : max_in_connections(0), max_out_connections(0), local_keypair(std::move(keypair)),
        handshake_timeout(protocol::DEFAULT_HANDSHAKE_TIMEOUT), max_message_size(protocol::DEFAULT_MAX_MESSAGE_SIZE),
        send_queue_limit(protocol::DEFAULT_SEND_QUEUE_SIZE), io_threads(protocol::DEFAULT_IO_THREADS),
        read_timeout(protocol::DEFAULT_READ_TIMEOUT), write_timeout(protocol::DEFAULT_WRITE_TIMEOUT),
        rate_limit(protocol::DEFAULT_RATE_LIMIT), rate_time_window(protocol::DEFAULT_RATE_TIME_WINDOW),
        rate_bucket_size(protocol::DEFAULT_RATE_BUCKET_SIZE) {}

  PeerIdentity local_peer_id() const { return PeerIdentity::FromKeyPair(local_keypair); }
};

}  // namespace network
}  // namespace peernet
