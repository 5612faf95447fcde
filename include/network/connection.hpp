// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/bandwidth_limiter.hpp"
#include "network/connection_types.hpp"
#include "network/handshake.hpp"
#include "network/peer_identity.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <queue>
#include <vector>

#include <asio.hpp>

namespace peernet {
namespace network {

// Process-wide byte totals shared by all connections of one manager
struct TrafficCounters {
  std::atomic<uint64_t> bytes_sent{0};
  std::atomic<uint64_t> bytes_received{0};
};

// Point-in-time copy of a registered connection
struct ConnectionSummary {
  ConnectionId id{0};
  TransportKind kind{TransportKind::TCP};
  Direction direction{Direction::INBOUND};
  PeerIdentity remote_identity;
  NetworkAddress remote_address;
  ConnectionState state{ConnectionState::ESTABLISHED};
  uint64_t bytes_sent{0};
  uint64_t bytes_received{0};
  std::chrono::steady_clock::time_point established_at;
};

class Connection;
using ConnectionPtr = std::shared_ptr<Connection>;

/**
 * Connection - an established, identity-verified transport connection
 *
 * Only constructible from a completed handshake, so remote_identity() is
 * always the verified key of the peer. All socket work is serialized on a
 * strand over the shared io_context.
 *
 * Wire format after the handshake: length-prefixed frames
 * (4-byte big-endian length | payload). A frame larger than
 * max_message_size closes the connection.
 *
 * Timeouts: once a header has arrived the payload must follow within
 * read_timeout, and each queued frame must be written within write_timeout;
 * otherwise the connection closes. An idle connection between frames is
 * not timed out.
 *
 * Bandwidth: with rate_limit set, each direction is shaped by its own
 * BandwidthLimiter. Reads pause between frames (the peer is back-pressured
 * by TCP flow control) and writes pause between queued frames.
 *
 * Close path: ESTABLISHED -> CLOSING -> CLOSED. The ClosedHandler given at
 * creation runs exactly once, on the strand, after the socket is torn down.
 * The registry uses it to release the connection's slot, so every close
 * path (local close, peer EOF, I/O error, overflow) frees the slot.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
  struct Options {
    uint32_t max_message_size;
    size_t send_queue_limit;
    std::chrono::milliseconds read_timeout{protocol::DEFAULT_READ_TIMEOUT};
    std::chrono::milliseconds write_timeout{protocol::DEFAULT_WRITE_TIMEOUT};
    uint64_t rate_limit{protocol::DEFAULT_RATE_LIMIT};
    std::chrono::milliseconds rate_time_window{protocol::DEFAULT_RATE_TIME_WINDOW};
    uint64_t rate_bucket_size{protocol::DEFAULT_RATE_BUCKET_SIZE};
  };

  using FrameHandler = std::function<void(ConnectionId id, const PeerIdentity& peer, std::vector<uint8_t> payload)>;
  using ClosedHandler = std::function<void(ConnectionId id)>;

  static ConnectionPtr Create(asio::io_context& io_context, HandshakeResult&& handshake, TransportKind kind,
                              const Options& options, std::shared_ptr<TrafficCounters> totals,
                              ClosedHandler on_closed);

  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Begin the read loop. handler may be empty (frames are then dropped).
  void Start(FrameHandler handler);

  // Queue one frame. Returns false if the connection is no longer
  // established or the payload exceeds max_message_size. Send queue overflow
  // closes the connection asynchronously.
  bool Send(std::vector<uint8_t> payload);

  // Request an asynchronous close. Idempotent.
  void Close();

  // Close and block until teardown (and the ClosedHandler) completed.
  // From a thread of the shared io_context this degrades to Close().
  void CloseAndWait();

  ConnectionId id() const { return id_; }
  TransportKind kind() const { return kind_; }
  Direction direction() const { return direction_; }
  const PeerIdentity& remote_identity() const { return remote_identity_; }
  const NetworkAddress& remote_address() const { return remote_address_; }
  ConnectionState state() const { return state_.load(std::memory_order_acquire); }
  bool is_established() const { return state() == ConnectionState::ESTABLISHED; }

  uint64_t bytes_sent() const { return bytes_sent_.load(std::memory_order_relaxed); }
  uint64_t bytes_received() const { return bytes_received_.load(std::memory_order_relaxed); }
  std::chrono::steady_clock::time_point established_at() const { return established_at_; }

  ConnectionSummary summary() const;

private:
  Connection(asio::io_context& io_context, HandshakeResult&& handshake, TransportKind kind, const Options& options,
             std::shared_ptr<TrafficCounters> totals, ClosedHandler on_closed);

  void read_header_impl();
  void read_payload_impl(uint32_t size);
  void read_next_impl(uint64_t wire_bytes);
  void do_write_impl();
  void write_next_impl(uint64_t wire_bytes);
  void arm_read_deadline_impl();
  void arm_write_deadline_impl();
  void close_impl();

  static std::atomic<ConnectionId> next_id_;

  asio::io_context& io_context_;
  RawSocket socket_;
  asio::strand<asio::any_io_executor> strand_;
  asio::steady_timer read_timer_;
  asio::steady_timer write_timer_;
  asio::steady_timer read_pause_timer_;
  asio::steady_timer write_pause_timer_;

  const ConnectionId id_;
  const TransportKind kind_;
  const Direction direction_;
  const PeerIdentity remote_identity_;
  const NetworkAddress remote_address_;
  const Options options_;
  const std::chrono::steady_clock::time_point established_at_;

  std::shared_ptr<TrafficCounters> totals_;
  ClosedHandler on_closed_;
  FrameHandler frame_handler_;

  std::atomic<ConnectionState> state_{ConnectionState::ESTABLISHED};
  std::atomic<uint64_t> bytes_sent_{0};
  std::atomic<uint64_t> bytes_received_{0};

  std::array<uint8_t, protocol::FRAME_HEADER_SIZE> header_buffer_{};
  std::vector<uint8_t> payload_buffer_;

  // Bumped when a payload read / frame write completes; a deadline whose
  // generation is stale belongs to an operation that already finished
  uint64_t read_generation_{0};
  uint64_t write_generation_{0};
  BandwidthLimiter read_limiter_;
  BandwidthLimiter write_limiter_;

  std::queue<std::shared_ptr<std::vector<uint8_t>>> send_queue_;
  size_t send_queue_bytes_{0};
  bool writing_{false};
  bool started_{false};
};

}  // namespace network
}  // namespace peernet
